#pragma once

#include <string>
#include "Inode.hpp"
#include "Volume.hpp"

namespace roxfs
{

static const size_t MaxSymlinkTarget = 1024;

// Target stored in the literal area or in data fork blocks
std::string ReadSymlinkTarget(Volume const & volume, InodePtr const & inode);

}
