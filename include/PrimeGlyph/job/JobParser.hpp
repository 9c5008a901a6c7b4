#pragma once

#include "PrimeGlyph/core/Config.hpp"
#include "PrimeGlyph/core/Error.hpp"
#include "PrimeGlyph/job/JobSpec.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace PrimeGlyph {

// Parses and checks the batch envelope. Malformed JSON, an unsupported
// version, an empty or oversized job list fail the whole call; problems inside
// a single job are recorded in JobSpec::structuralError instead.
auto ParseBatch(std::string_view raw,
                EngineConfig const& config,
                Error* error = nullptr) -> std::optional<BatchSpec>;

// Envelope rules for an already built batch: version "1.0" and between one
// and maxJobsPerBatch jobs. ParseBatch applies the same rules.
auto ValidateBatch(BatchSpec const& batch, EngineConfig const& config, Error* error = nullptr) -> bool;

auto ParseJob(nlohmann::json const& value) -> JobSpec;

// Single job from one JSON text (one JSONL line). Never fails; unparsable
// input comes back with structuralError set.
auto ParseJobJson(std::string_view raw) -> JobSpec;

// Returns a human-readable reason when the job cannot be rendered.
auto ValidateJob(JobSpec const& job, EngineConfig const& config) -> std::optional<std::string>;

auto ToJson(JobSpec const& job) -> nlohmann::json;

} // namespace PrimeGlyph
