#pragma once

#include "route_table.hpp"

namespace routegen {

// Rewrites the last segment of `handler` to "<method>_<segment>":
// s3::bucket + POST -> s3::post_bucket.
path_template derive_handler_name(const path_template& handler, method m);

} // namespace routegen
