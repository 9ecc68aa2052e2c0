// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

struct ProxyResponse;

/**
 * Generate the HTML page with the URL input form which is shown
 * when the proxy is requested without a target.
 *
 * @param script_path the path the form is submitted to
 */
ProxyResponse
MakeInputForm(std::string_view script_path) noexcept;
