#pragma once

#include "eryzaa/discovery/v1/advertisement.pb.h"
#include "eryzaa/access/v1/account_helper.pb.h"

namespace eryzaa::node::v1 {
using namespace ::eryzaa::discovery::v1;
using namespace ::eryzaa::access::v1;
}
