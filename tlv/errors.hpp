#ifndef TLV_ERRORS_HPP
#define TLV_ERRORS_HPP

#include <stdexcept>
#include <string>

// Socket absent, closed or failed irrecoverably
class ConnectionError : public std::runtime_error
{
public:
    explicit ConnectionError(const std::string &what) : std::runtime_error(what) {}
};

// Buffer too short for the frame it declares, or payload too large
class FormatError : public std::runtime_error
{
public:
    explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

// Egress queue full under OverflowPolicy::REJECT
class OverflowError : public std::runtime_error
{
public:
    explicit OverflowError(const std::string &what) : std::runtime_error(what) {}
};

// Malformed HTTP request or failed response write
class HttpError : public std::runtime_error
{
public:
    explicit HttpError(const std::string &what) : std::runtime_error(what) {}
};

#endif
