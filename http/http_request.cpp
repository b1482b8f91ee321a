#include "http_request.hpp"
#include "tlv/errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

bool CaseInsensitiveLess::operator()(const std::string &a, const std::string &b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y)
        { return std::tolower(x) < std::tolower(y); });
}

const char *status_reason(int code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 411:
        return "Length Required";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    case 501:
        return "Not Implemented";
    default:
        return "Unknown";
    }
}

HttpRequest::HttpRequest(std::string method, std::string path, HttpHeaders headers,
                         std::istream &rfile, std::ostream &wfile)
    : request_method(std::move(method)), request_path(std::move(path)),
      request_headers(std::move(headers)), rfile(rfile), wfile(wfile)
{
}

const std::string &HttpRequest::method() const
{
    return request_method;
}

const std::string &HttpRequest::path() const
{
    return request_path;
}

const HttpHeaders &HttpRequest::headers() const
{
    return request_headers;
}

std::optional<std::string> HttpRequest::header(const std::string &name) const
{
    auto it = request_headers.find(name);
    if (it == request_headers.end())
        return std::nullopt;
    return it->second;
}

std::optional<size_t> HttpRequest::content_length() const
{
    auto value = header("Content-Length");
    if (!value || value->empty())
        return std::nullopt;

    size_t length = 0;
    for (char c : *value)
    {
        if (c < '0' || c > '9')
            return std::nullopt;

        size_t digit = static_cast<size_t>(c - '0');
        if (length > (std::numeric_limits<size_t>::max() - digit) / 10)
            return std::nullopt;
        length = length * 10 + digit;
    }

    return length;
}

std::vector<uint8_t> HttpRequest::read_body(size_t len)
{
    std::vector<uint8_t> data(len);
    rfile.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(len));
    data.resize(static_cast<size_t>(rfile.gcount()));
    return data;
}

void HttpRequest::send_status(int code)
{
    wfile << "HTTP/1.0 " << code << " " << status_reason(code) << "\r\n"
          << "Content-type: text/html\r\n"
          << "\r\n";
}

void HttpRequest::write(const uint8_t *data, size_t len)
{
    wfile.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
    if (!wfile.good())
    {
        throw HttpError("Failed to write response body");
    }
}

void HttpRequest::write(const std::vector<uint8_t> &data)
{
    write(data.data(), data.size());
}
