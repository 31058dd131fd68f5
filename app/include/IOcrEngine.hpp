#pragma once
#include <filesystem>

class IOcrEngine {
public:
    virtual ~IOcrEngine() = default;
    // Writes a searchable copy of input to output; throws ErrorCodes::AppException on failure.
    virtual void make_searchable(const std::filesystem::path& input,
                                 const std::filesystem::path& output) = 0;
};
