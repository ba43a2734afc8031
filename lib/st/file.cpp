/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdio>
#include <filesystem>
#include <memory>
#include <st/file.hpp>

namespace scale_turbo::file {
    void read(const std::string &path, uint8_vector &buf)
    {
        std::unique_ptr<std::FILE, decltype(&std::fclose)> f { std::fopen(path.c_str(), "rb"), &std::fclose };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open file {} for reading", path));
        const auto sz = std::filesystem::file_size(path);
        buf.resize(sz);
        if (sz > 0 && std::fread(buf.data(), 1, sz, f.get()) != sz) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", sz, path));
    }
}
