#pragma once
#include <stdexcept>
#include <string>

// Base of every error CleanOCR throws on purpose.
class CleanOcrError : public std::runtime_error {
public:
    explicit CleanOcrError(const std::string& what) : std::runtime_error(what) {}
};

// Image file exists but could not be decoded into a raster.
class DecodeError : public CleanOcrError {
public:
    explicit DecodeError(const std::string& what) : CleanOcrError(what) {}
};

class NotFoundError : public CleanOcrError {
public:
    explicit NotFoundError(const std::string& what) : CleanOcrError(what) {}
};

// A grammar/spelling/OCR engine could not be brought up.
class CapabilityUnavailable : public CleanOcrError {
public:
    explicit CapabilityUnavailable(const std::string& what) : CleanOcrError(what) {}
};

// A single call into an engine failed or ran past its deadline.
class CapabilityCallFailure : public CleanOcrError {
public:
    explicit CapabilityCallFailure(const std::string& what) : CleanOcrError(what) {}
};
