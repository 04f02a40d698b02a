#pragma once

#include <map>
#include <string>

/**
 * @brief Synchronous HTTP/HTTPS client on Boost.Beast
 *
 * One request per call, connection closed afterwards. Safe to call from
 * several threads at once. Errors never throw:
 * they come back in Response::error with success == false.
 */
class NativeHTTPClient {
public:
    struct Response {
        int statusCode = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        std::string error;
        bool success = false;
    };

    NativeHTTPClient();

    Response get(const std::string& url,
                 const std::map<std::string, std::string>& headers = {});

    Response post(const std::string& url,
                  const std::string& body,
                  const std::map<std::string, std::string>& headers = {});

    // Set request timeout (seconds)
    void setTimeout(int seconds);

private:
    int m_timeout;

    Response makeRequest(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers);
};
