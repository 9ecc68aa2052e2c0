// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Form.hxx"
#include "ProxyRequest.hxx"
#include "http/Status.hxx"
#include "uri/ProxyLink.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"

#include <fmt/core.h>

static constexpr char form_template[] = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Web Proxy</title>
<style>
body {{ margin: 0; min-height: 100vh; display: flex; align-items: center; justify-content: center; font-family: sans-serif; background: #f0f2f5; }}
.container {{ width: 90%; max-width: 36em; padding: 2em; border-radius: 8px; background: #fff; box-shadow: 0 4px 12px rgba(0, 0, 0, 0.1); text-align: center; }}
form {{ display: flex; gap: 0.5em; }}
input {{ flex: 1; padding: 0.6em; border: 1px solid #ccc; border-radius: 4px; font-size: 1em; }}
button {{ padding: 0.6em 1.2em; border: none; border-radius: 4px; background: #007bff; color: #fff; font-size: 1em; cursor: pointer; }}
</style>
</head>
<body>
<div class="container">
<h1>Web Proxy</h1>
<form action="{}" method="GET">
<input type="text" name="{}" placeholder="https://example.com" required autofocus>
<button type="submit">Go</button>
</form>
</div>
</body>
</html>
)";

ProxyResponse
MakeInputForm(std::string_view script_path) noexcept
{
	ProxyResponse response;
	response.status = HttpStatus::OK;
	response.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
	response.body = fmt::format(form_template,
				    EscapeToString(html_escape_class, script_path),
				    proxy_link_parameter);
	return response;
}
