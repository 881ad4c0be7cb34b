#include "https_client.hpp"
#include <httplib.h>

namespace tokenwarden {

HttpsResponse https_post_form(
    const std::string& base_url,
    const std::string& path,
    const FormFields& fields,
    int timeout_sec)
{
    HttpsResponse resp;

    httplib::Client cli(base_url);
    if (!cli.is_valid()) {
        resp.body = "[error] invalid endpoint: " + base_url;
        return resp;
    }
    cli.set_connection_timeout(timeout_sec);
    cli.set_read_timeout(timeout_sec);

    httplib::Params params;
    for (auto& [k, v] : fields) {
        params.emplace(k, v);
    }

    auto res = cli.Post(path, params);
    if (!res) {
        resp.body = "[error] connection failed: " + httplib::to_string(res.error());
        return resp;
    }
    resp.status = res->status;
    resp.body = res->body;
    return resp;
}

} // namespace tokenwarden
