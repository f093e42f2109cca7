#include <flocker/docker/types.h>

#include <algorithm>
#include <cctype>

namespace flocker::docker {

Result<ImageReference> ImageReference::parse(std::string_view text) {
    std::string s(text);
    s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                    [](unsigned char c) { return !std::isspace(c); }));
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();

    if (s.empty())
        return Error{ErrorCode::InvalidArgument, "Image reference is empty"};
    if (std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }))
        return Error{ErrorCode::InvalidArgument, "Image reference contains whitespace: " + s};

    ImageReference ref;
    if (auto at = s.find('@'); at != std::string::npos) {
        ref.repository = s.substr(0, at);
        ref.digest = s.substr(at + 1);
        if (ref.repository.empty() || ref.digest.find(':') == std::string::npos)
            return Error{ErrorCode::InvalidArgument, "Invalid image digest reference: " + s};
        return ref;
    }

    // A ':' after the last '/' separates the tag; earlier ones belong to a registry port.
    auto slash = s.rfind('/');
    auto colon = s.rfind(':');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        ref.repository = s.substr(0, colon);
        ref.tag = s.substr(colon + 1);
        if (ref.tag.empty())
            return Error{ErrorCode::InvalidArgument, "Image tag is empty: " + s};
    } else {
        ref.repository = s;
        ref.tag = "latest";
    }
    if (ref.repository.empty() || ref.repository.back() == '/')
        return Error{ErrorCode::InvalidArgument, "Invalid image repository: " + s};
    return ref;
}

std::string ImageReference::str() const {
    if (!digest.empty())
        return repository + "@" + digest;
    return repository + ":" + (tag.empty() ? std::string("latest") : tag);
}

} // namespace flocker::docker
