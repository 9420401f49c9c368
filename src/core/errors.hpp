#pragma once

#include <stdexcept>
#include <string>

struct BatchqError : public std::runtime_error
{
    explicit BatchqError(const std::string& s) : std::runtime_error(s) {}
};

// Unrecognized backend, malformed job spec or dependency, or a scheduler
// status table whose layout we don't understand. Never retried.
struct ConfigError : public BatchqError
{
    explicit ConfigError(const std::string& s) : BatchqError(s) {}
};

// The submission tool kept failing, or answered without a job ID.
struct SubmissionError : public BatchqError
{
    explicit SubmissionError(const std::string& s) : BatchqError(s) {}
};

// A status query (squeue/qstat) failed while waiting.
struct QueryError : public BatchqError
{
    explicit QueryError(const std::string& s) : BatchqError(s) {}
};
