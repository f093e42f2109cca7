#include <flocker/registry/hub_client.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <charconv>
#include <memory>
#include <mutex>

namespace flocker::registry {

using json = nlohmann::json;

namespace {

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

Result<std::string> httpGet(const std::string& url, std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl{curl_easy_init()};
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 10000)));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "flocker");

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        auto code = rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::NetworkError;
        return Error{code, std::string("Failed to fetch tags: ") + curl_easy_strerror(rc)};
    }
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    spdlog::debug("GET {} -> {}", url, status);
    if (status == 404)
        return Error{ErrorCode::NotFound, "Repository not found on Docker Hub"};
    if (status < 200 || status >= 300)
        return Error{ErrorCode::NetworkError, "Failed to fetch tags: HTTP " + std::to_string(status)};
    return body;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool readInt(std::string_view s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size())
        return false;
    auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + len, out);
    return ec == std::errc() && ptr == s.data() + pos + len;
}

} // namespace

HubClient::HubClient(HubClientConfig config) : config_(std::move(config)) {}

Result<std::vector<Tag>> HubClient::fetchTags(const std::string& repository) const {
    static std::once_flag curlInit;
    std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    std::string url = config_.baseUrl + "/" + repository +
                      "/tags?page_size=" + std::to_string(config_.pageSize);
    std::vector<Tag> tags;

    for (std::size_t page = 0; page < config_.maxPages; ++page) {
        auto body = httpGet(url, config_.timeout);
        if (!body)
            return body.error();
        auto parsed = parseTagPage(body.value());
        if (!parsed)
            return parsed.error();

        auto& result = parsed.value();
        tags.insert(tags.end(), std::make_move_iterator(result.tags.begin()),
                    std::make_move_iterator(result.tags.end()));
        if (!result.next)
            return tags;
        url = *result.next;
    }
    spdlog::warn("Stopped listing tags of {} after {} pages", repository, config_.maxPages);
    return tags;
}

Result<TagPage> parseTagPage(std::string_view body) {
    json doc;
    try {
        doc = json::parse(body.begin(), body.end());
    } catch (const json::exception& e) {
        return Error{ErrorCode::MalformedResponse,
                     std::string("Failed to parse tags response: ") + e.what()};
    }
    if (!doc.is_object() || !doc.contains("results") || !doc["results"].is_array())
        return Error{ErrorCode::MalformedResponse, "Tags response has no results"};

    TagPage page;
    for (const auto& entry : doc["results"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string())
            continue;
        Tag tag;
        tag.name = entry["name"].get<std::string>();
        if (entry.contains("last_updated") && entry["last_updated"].is_string())
            tag.lastUpdated = entry["last_updated"].get<std::string>();
        if (entry.contains("full_size") && entry["full_size"].is_number_unsigned())
            tag.fullSize = entry["full_size"].get<uint64_t>();
        page.tags.push_back(std::move(tag));
    }
    if (doc.contains("next") && doc["next"].is_string() && !doc["next"].get<std::string>().empty())
        page.next = doc["next"].get<std::string>();
    return page;
}

std::optional<TimePoint> parseTimestamp(std::string_view s) {
    // YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
    int year, month, day, hour, minute, second;
    if (s.size() < 20 || s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != 't' && s[10] != ' ') ||
        s[13] != ':' || s[16] != ':')
        return std::nullopt;
    if (!readInt(s, 0, 4, year) || !readInt(s, 5, 2, month) || !readInt(s, 8, 2, day) ||
        !readInt(s, 11, 2, hour) || !readInt(s, 14, 2, minute) || !readInt(s, 17, 2, second))
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9')
            ++pos;
    }
    if (pos >= s.size())
        return std::nullopt;

    int64_t offsetSeconds = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int oh, om;
        if (!readInt(s, pos + 1, 2, oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !readInt(s, pos + 4, 2, om))
            return std::nullopt;
        offsetSeconds = (oh * 3600 + om * 60) * (s[pos] == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size())
        return std::nullopt;

    const int64_t days =
        daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offsetSeconds;
    return TimePoint(std::chrono::seconds(secs));
}

std::string formatRelativeTime(TimePoint now, std::string_view rfc3339) {
    auto then = parseTimestamp(rfc3339);
    if (!then)
        return "unknown time ago";

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - *then).count();
    const int64_t days = elapsed / 86400;
    const int64_t weeks = days / 7;
    const int64_t months = days / 30;
    const int64_t years = days / 365;

    if (years > 0)
        return std::to_string(years) + " years ago";
    if (months > 0)
        return std::to_string(months) + " months ago";
    if (weeks > 0)
        return std::to_string(weeks) + " weeks ago";
    if (days > 0)
        return std::to_string(days) + " days ago";
    if (elapsed / 3600 > 0)
        return std::to_string(elapsed / 3600) + " hours ago";
    if (elapsed / 60 > 0)
        return std::to_string(elapsed / 60) + " minutes ago";
    return "seconds ago";
}

} // namespace flocker::registry
