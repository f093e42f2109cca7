#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <flocker/core/types.h>

namespace flocker::registry {

struct Tag {
    std::string name;
    std::string lastUpdated; // RFC 3339, as reported by Docker Hub
    uint64_t fullSize{0};
};

struct TagPage {
    std::vector<Tag> tags;
    std::optional<std::string> next;
};

struct HubClientConfig {
    std::string baseUrl{"https://hub.docker.com/v2/repositories"};
    uint32_t pageSize{100};
    std::chrono::milliseconds timeout{20000};
    // Guards against a registry that keeps handing out `next` links
    std::size_t maxPages{50};
};

/**
 * Docker Hub tag listing. Follows `next` links until the last page.
 */
class HubClient {
public:
    explicit HubClient(HubClientConfig config = {});

    Result<std::vector<Tag>> fetchTags(const std::string& repository) const;

private:
    HubClientConfig config_;
};

Result<TagPage> parseTagPage(std::string_view body);

std::optional<TimePoint> parseTimestamp(std::string_view rfc3339);

// "3 days ago", "2 weeks ago", ... matching the granularity Docker Hub users expect.
std::string formatRelativeTime(TimePoint now, std::string_view rfc3339);

} // namespace flocker::registry
