#include "transferq/fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>

#include <curl/curl.h>
#include <fmt/format.h>
#include <openssl/evp.h>

namespace transferq {

namespace {

constexpr std::size_t kFingerprintBytes = 16;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string urlPath(const std::string& source) {
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    UrlHandle url{curl_url(), &curl_url_cleanup};
    if (url && curl_url_set(url.get(), CURLUPART_URL, source.c_str(), CURLU_NON_SUPPORT_SCHEME) == CURLUE_OK) {
        char* path = nullptr;
        if (curl_url_get(url.get(), CURLUPART_PATH, &path, 0) == CURLUE_OK && path) {
            std::string out{path};
            curl_free(path);
            return out;
        }
    }

    // Not a URL libcurl accepts; treat the whole string as a path.
    const auto cut = source.find_first_of("?#");
    return source.substr(0, cut);
}

std::string lastSegment(const std::string& source) {
    std::string path = urlPath(source);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

std::string makeFingerprint(const std::string& source, const std::string& alias) {
    auto contextDeleter = [](EVP_MD_CTX* ctx) {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    };
    std::unique_ptr<EVP_MD_CTX, decltype(contextDeleter)> context(EVP_MD_CTX_new(), contextDeleter);
    if (!context) {
        throw std::runtime_error("Failed to create OpenSSL digest context");
    }

    const char separator = '\n';
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.get(), source.data(), source.size()) != 1 ||
        EVP_DigestUpdate(context.get(), &separator, 1) != 1 ||
        EVP_DigestUpdate(context.get(), alias.data(), alias.size()) != 1) {
        throw std::runtime_error("Failed to compute transfer fingerprint");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest, &length) != 1) {
        throw std::runtime_error("Failed to finalize transfer fingerprint");
    }

    std::string hex;
    hex.reserve(kFingerprintBytes * 2);
    for (std::size_t i = 0; i < kFingerprintBytes && i < length; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string aliasFromSource(const std::string& source) {
    const std::string segment = lastSegment(source);
    if (segment.empty()) {
        return "Unknown";
    }

    std::string data = toLower(segment);
    const auto marker = data.find("free-download");
    if (marker != std::string::npos) {
        data = data.substr(0, marker);
        while (!data.empty() && data.back() == '-') {
            data.pop_back();
        }
    }

    static const std::regex version_suffix{R"(-v?\d+[\d\.-]*.*$)"};
    static const std::regex build_suffix{R"(-build-\d+.*$)"};
    static const std::regex rip_suffix{R"(-rip.*$)"};
    data = std::regex_replace(data, version_suffix, "");
    data = std::regex_replace(data, build_suffix, "");
    data = std::regex_replace(data, rip_suffix, "");

    std::string title;
    title.reserve(data.size());
    bool word_start = true;
    for (char c : data) {
        if (c == '-' || c == '_') {
            c = ' ';
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            title += word_start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            word_start = false;
        } else {
            title += c;
            word_start = true;
        }
    }

    const auto first = title.find_first_not_of(' ');
    if (first == std::string::npos) {
        return "Unknown";
    }
    const auto last = title.find_last_not_of(' ');
    return title.substr(first, last - first + 1);
}

std::string extensionFromSource(const std::string& source) {
    const std::string segment = lastSegment(source);
    const auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == segment.size()) {
        return "bin";
    }
    std::string ext = toLower(segment.substr(dot + 1));
    const bool alnum = std::all_of(ext.begin(), ext.end(),
                                   [](unsigned char c) { return std::isalnum(c) != 0; });
    if (!alnum || ext.size() > 8) {
        return "bin";
    }

    const std::string stem = toLower(segment.substr(0, dot));
    if (stem.size() > 4 && stem.compare(stem.size() - 4, 4, ".tar") == 0) {
        return "tar." + ext;
    }
    return ext;
}

} // namespace transferq
