#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Finite, pull-based sequence of text lines from one document.
 *
 * next_line() returns std::nullopt once the document is exhausted. Dropping
 * the source before that point releases whatever produces the lines.
 */
class TextLineSource {
public:
    virtual ~TextLineSource() = default;
    virtual std::optional<std::string> next_line() = 0;
};

/**
 * @brief Lines held in memory; used for literal text and in tests.
 */
class VectorLineSource : public TextLineSource {
public:
    explicit VectorLineSource(std::vector<std::string> lines)
        : lines_(std::move(lines)) {}

    std::optional<std::string> next_line() override {
        if (position_ >= lines_.size()) {
            return std::nullopt;
        }
        ++consumed_;
        return lines_[position_++];
    }

    size_t consumed() const { return consumed_; }

private:
    std::vector<std::string> lines_;
    size_t position_{0};
    size_t consumed_{0};
};

class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;
    // Fresh extraction on every call; nothing is cached between documents.
    virtual std::unique_ptr<TextLineSource> open(const std::filesystem::path& searchable_pdf) = 0;
};
