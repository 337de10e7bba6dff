#ifndef TAXSYNTH_EXCEPTIONS_H
#define TAXSYNTH_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace TaxSynth {

class TaxSynthException : public std::runtime_error {
public:
    explicit TaxSynthException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public TaxSynthException {
public:
    explicit IOException(const std::string& message) : TaxSynthException("IO Error: " + message) {}
};

class DatasetException : public TaxSynthException {
public:
    explicit DatasetException(const std::string& message) : TaxSynthException("Dataset Error: " + message) {}
};

// Raised when a requested row count exceeds what the dataset holds.
class OutOfRangeException : public DatasetException {
public:
    explicit OutOfRangeException(const std::string& message) : DatasetException("Out of range: " + message) {}
};

class ConfigurationException : public TaxSynthException {
public:
    explicit ConfigurationException(const std::string& message) : TaxSynthException("Configuration Error: " + message) {}
};

} // namespace TaxSynth

#endif // TAXSYNTH_EXCEPTIONS_H
