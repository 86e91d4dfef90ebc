//
// Created by Giuseppe Francione on 06/12/25.
//

#ifndef PIXTRIM_RELEASE_SOURCE_HPP
#define PIXTRIM_RELEASE_SOURCE_HPP

#include <filesystem>
#include <string>
#include <utility>

namespace pixtrim {

inline constexpr const char* kDefaultReleaseUrl =
    "https://api.github.com/repos/Snesnopic/pixtrim/releases/latest";

/**
 * @brief Where release information and artifacts come from.
 */
class IReleaseSource {
public:
    virtual ~IReleaseSource() = default;

    /**
     * @brief Fetch the raw JSON of the latest release.
     * @throws UpdateError(NetworkError)
     */
    virtual std::string fetch_latest() = 0;

    /**
     * @brief Download `url` into `destination`, replacing it.
     * @throws UpdateError(NetworkError)
     */
    virtual void download(const std::string& url, const std::filesystem::path& destination) = 0;
};

/**
 * @brief IReleaseSource over HTTPS with cpp-httplib.
 *
 * Redirects are followed (GitHub serves assets from a different host).
 */
class HttpReleaseSource final : public IReleaseSource {
public:
    /**
     * @param release_url Full URL of the "latest release" API endpoint.
     * @param user_agent Sent with every request; GitHub rejects requests without one.
     */
    HttpReleaseSource(std::string release_url, std::string user_agent);

    std::string fetch_latest() override;
    void download(const std::string& url, const std::filesystem::path& destination) override;

private:
    std::string release_url_;
    std::string user_agent_;
};

/**
 * @brief Split "https://host[:port]/path" into ("https://host[:port]", "/path").
 * @throws UpdateError(NetworkError) if the URL has no scheme or host.
 */
[[nodiscard]] std::pair<std::string, std::string> split_url(const std::string& url);

} // namespace pixtrim

#endif // PIXTRIM_RELEASE_SOURCE_HPP
