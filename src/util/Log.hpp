#pragma once

#include <boost/log/trivial.hpp>

// Records go to whatever sinks the embedding application configured with Boost.Log
#define ROXFS_LOG(severity) BOOST_LOG_TRIVIAL(severity) << "roxfs: "
