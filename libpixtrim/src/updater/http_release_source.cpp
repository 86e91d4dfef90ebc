//
// Created by Giuseppe Francione on 06/12/25.
//

#include "../../include/updater/release_source.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <httplib.h>
#include <fstream>

namespace pixtrim {

namespace {

    httplib::Client make_client(const std::string& origin, const std::string& user_agent) {
        httplib::Client cli(origin);
        cli.set_follow_location(true);
        cli.set_connection_timeout(15);
        cli.set_read_timeout(60);
        cli.set_default_headers({{"User-Agent", user_agent}});
        return cli;
    }

    std::string describe(const httplib::Result& res) {
        if (!res) return httplib::to_string(res.error());
        return "HTTP " + std::to_string(res->status);
    }

} // namespace

std::pair<std::string, std::string> split_url(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme == 0) {
        throw UpdateError(UpdateErrorKind::NetworkError, "invalid URL: " + url);
    }
    const auto path_start = url.find('/', scheme + 3);
    std::string origin = url.substr(0, path_start);
    if (origin.size() <= scheme + 3) {
        throw UpdateError(UpdateErrorKind::NetworkError, "invalid URL: " + url);
    }
    std::string path = path_start == std::string::npos ? "/" : url.substr(path_start);
    return {std::move(origin), std::move(path)};
}

HttpReleaseSource::HttpReleaseSource(std::string release_url, std::string user_agent)
    : release_url_(std::move(release_url)), user_agent_(std::move(user_agent)) {}

std::string HttpReleaseSource::fetch_latest() {
    const auto [origin, path] = split_url(release_url_);
    Logger::log(LogLevel::Debug, "GET " + release_url_, "updater");

    auto cli = make_client(origin, user_agent_);
    const auto res = cli.Get(path, {{"Accept", "application/vnd.github+json"}});
    if (!res || res->status != 200) {
        throw UpdateError(UpdateErrorKind::NetworkError,
                          "cannot fetch release information from " + release_url_ + ": " + describe(res));
    }
    return res->body;
}

void HttpReleaseSource::download(const std::string& url, const std::filesystem::path& destination) {
    const auto [origin, path] = split_url(url);
    Logger::log(LogLevel::Debug, "Downloading " + url + " to " + destination.string(), "updater");

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw UpdateError(UpdateErrorKind::NetworkError, "cannot open " + destination.string() + " for writing");
    }

    auto cli = make_client(origin, user_agent_);
    const auto res = cli.Get(path, {{"Accept", "application/octet-stream"}},
                             [&out](const char* data, const size_t len) {
                                 out.write(data, static_cast<std::streamsize>(len));
                                 return static_cast<bool>(out);
                             });
    out.close();
    if (!res || res->status != 200) {
        throw UpdateError(UpdateErrorKind::NetworkError, "download of " + url + " failed: " + describe(res));
    }
    if (!out) {
        throw UpdateError(UpdateErrorKind::NetworkError, "write error while saving " + destination.string());
    }
}

} // namespace pixtrim
