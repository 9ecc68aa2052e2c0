// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <utility>
#include <vector>

/**
 * An ordered list of HTTP headers.  Names keep their original
 * spelling, duplicates are allowed.
 */
using HeaderList = std::vector<std::pair<std::string, std::string>>;
