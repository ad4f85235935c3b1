/**
 * Name: shdoc::input::FileInput
 * Purpose: File-backed input source implementation.
 * Theory of Operation: Opens the file eagerly; an unopenable path or a read
 *   failure other than end-of-file raises exceptions::FileReadError.
 */
#pragma once

#include <istream>
#include <memory>
#include <string>
#include "shdoc/input/input_source.h"

namespace shdoc::input {

class FileInput : public InputSource {
public:
    explicit FileInput(std::string path);

    bool getline(std::string& out) override;

    const std::string& name() const override { return path_; }

private:
    std::string path_{};
    std::unique_ptr<std::istream> in_{nullptr};
};

} // namespace shdoc::input
