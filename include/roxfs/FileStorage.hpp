#ifndef _ROXFS_API_FILE_STORAGE_H
#define _ROXFS_API_FILE_STORAGE_H

#include <memory>
#include "roxfs/Common.hpp"
#include "roxfs/Defs.hpp"
#include "roxfs/IStorage.hpp"

namespace roxfs
{

// Opens an image file or a block device for reading
ROXFS_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const char * fileName);
ROXFS_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName);

}

#endif
