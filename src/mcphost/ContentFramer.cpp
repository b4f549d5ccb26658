//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Newline-delimited (MCP stdio default) and Content-Length framers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphost/ContentFramer.h"

namespace mcphost {

namespace {

bool isBlank(const std::string& buffer, std::size_t from, std::size_t to) {
    for (std::size_t k = from; k < to; ++k) {
        if (!std::isspace(static_cast<unsigned char>(buffer[k]))) {
            return false;
        }
    }
    return true;
}

class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Line exceeds limit (max={}), dropping {} bytes", maxLineLength, buffer.size());
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Blank lines already scanned may be dropped
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            if (isBlank(buffer, start, eol)) {
                start = eol + 1;
                continue;
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') {
                --end;
            }
            if (end - start > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds limit (max={})", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                if (name == "content-length") {
                    std::size_t used = 0;
                    unsigned long long v64 = 0;
                    try {
                        v64 = std::stoull(value, &used);
                    } catch (const std::exception&) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            if (eol == headerEnd) {
                break;
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, contentLength), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode) {
    switch (mode) {
        case FramingMode::ContentLength: return MakeContentLengthFramer();
        case FramingMode::NewlineDelimited: break;
    }
    return MakeNewlineFramer();
}

} // namespace mcphost
