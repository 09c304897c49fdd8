#pragma once
// Error taxonomy for the ingestion pipeline.
//   IoError, ParseError -- per-chunk, retried then surfaced in the result
//   StoreError          -- store unusable while resolving sub-entities
//   ConfigError         -- rejected configuration (CLI exit code 1)
// Insert conflicts and rejected documents are values, not exceptions
// (InsertStatus::CONFLICT, WriteFailure).
#include <stdexcept>
#include <string>

namespace mdingest {

class IngestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IoError : public IngestError {
public:
    using IngestError::IngestError;
};

class ParseError : public IngestError {
public:
    using IngestError::IngestError;
};

class StoreError : public IngestError {
public:
    using IngestError::IngestError;
};

class ConfigError : public IngestError {
public:
    using IngestError::IngestError;
};

} // namespace mdingest
