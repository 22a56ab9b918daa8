// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangedl/core/transport.hpp>
#include <rangedl/core/url.hpp>
#include <string>
#include <string_view>

namespace rangedl::core {

// Filename from a Content-Disposition value ("attachment; filename=\"a.zip\""),
// percent-decoded. Empty when the header carries none.
[[nodiscard]] std::string parse_content_disposition(std::string_view value);

// Destination for a download:
//   - no requested path: the server's filename, else the URL's last component
//   - requested path is an existing directory: that directory / filename
//   - otherwise the requested path verbatim
[[nodiscard]] std::string resolve_file_path(const Url& url,
                                            const Headers& response_headers,
                                            std::string_view requested_path);

} // namespace rangedl::core
