#pragma once
#include <string>
#include <vector>
#include <utility>

namespace tokenwarden {

struct HttpsResponse {
    int status = 0;
    std::string body;
    bool ok() const { return status >= 200 && status < 300; }
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Form-encoded POST via httplib + OpenSSL. base_url is scheme://host[:port];
// plain http is accepted for local endpoints. status stays 0 and body holds
// the transport error when no response was received.
HttpsResponse https_post_form(
    const std::string& base_url,
    const std::string& path,
    const FormFields& fields,
    int timeout_sec = 30
);

} // namespace tokenwarden
