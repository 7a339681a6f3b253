#ifndef NIKA_EXCEPTIONS_H
#define NIKA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Nika {

class NikaException : public std::runtime_error {
public:
    explicit NikaException(const std::string& message) : std::runtime_error(message) {}
};

class DatasetException : public NikaException {
public:
    explicit DatasetException(const std::string& message) : NikaException("Dataset Error: " + message) {}
};

class ModelingException : public NikaException {
public:
    explicit ModelingException(const std::string& message) : NikaException("Modeling Error: " + message) {}
};

class ConfigurationException : public NikaException {
public:
    explicit ConfigurationException(const std::string& message) : NikaException("Configuration Error: " + message) {}
};

class RequestException : public NikaException {
public:
    explicit RequestException(const std::string& message) : NikaException("Request Error: " + message) {}
};

} // namespace Nika

#endif // NIKA_EXCEPTIONS_H
