#pragma once
#include <stdexcept>
#include <string>

namespace escpos::types {

class EscposException : public std::runtime_error {
public:
    explicit EscposException(const std::string& msg)
        : std::runtime_error(msg) {}
};

class TransportException : public EscposException {
public:
    explicit TransportException(const std::string& msg)
        : EscposException(msg) {}
};

class EncodingException : public EscposException {
public:
    explicit EncodingException(const std::string& msg)
        : EscposException(msg) {}
};

class ConfigException : public EscposException {
public:
    explicit ConfigException(const std::string& msg)
        : EscposException(msg) {}
};

}
