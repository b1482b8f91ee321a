#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct CaseInsensitiveLess
{
    bool operator()(const std::string &a, const std::string &b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

// A request as seen by a path handler. The body is read from rfile, the
// response (status line, headers, body) is written to wfile.
class HttpRequest
{
private:
    std::string request_method;
    std::string request_path;
    HttpHeaders request_headers;
    std::istream &rfile;
    std::ostream &wfile;

public:
    HttpRequest(std::string method, std::string path, HttpHeaders headers,
                std::istream &rfile, std::ostream &wfile);

    const std::string &method() const;
    const std::string &path() const;
    const HttpHeaders &headers() const;
    std::optional<std::string> header(const std::string &name) const;

    // Content-Length as a number, std::nullopt when absent or malformed
    std::optional<size_t> content_length() const;

    // Reads up to len body bytes; fewer when the body is shorter
    std::vector<uint8_t> read_body(size_t len);

    // Status line, "Content-type: text/html", end of headers
    void send_status(int code);

    // Throws HttpError if the response stream refuses the bytes
    void write(const uint8_t *data, size_t len);
    void write(const std::vector<uint8_t> &data);
};

const char *status_reason(int code);

#endif
