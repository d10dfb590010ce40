#ifndef AUGUR_EXCEPTIONS_H
#define AUGUR_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Augur {

class AugurException : public std::runtime_error {
public:
    explicit AugurException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public AugurException {
public:
    explicit IOException(const std::string& message) : AugurException("IO Error: " + message) {}
};

class DatasetException : public AugurException {
public:
    explicit DatasetException(const std::string& message) : AugurException("Dataset Error: " + message) {}
};

class PlanningException : public AugurException {
public:
    explicit PlanningException(const std::string& message) : AugurException("Planning Error: " + message) {}
};

class ModelException : public AugurException {
public:
    explicit ModelException(const std::string& message) : AugurException("Model Error: " + message) {}
};

class ConfigurationException : public AugurException {
public:
    explicit ConfigurationException(const std::string& message) : AugurException("Configuration Error: " + message) {}
};

} // namespace Augur

#endif // AUGUR_EXCEPTIONS_H
