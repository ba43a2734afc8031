#pragma once
#ifndef SCALE_TURBO_JSON_FWD_HPP
#define SCALE_TURBO_JSON_FWD_HPP
/* This file is part of Scale Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <boost/json/fwd.hpp>

namespace scale_turbo::json {
    using namespace boost::json;
}

#endif // !SCALE_TURBO_JSON_FWD_HPP
