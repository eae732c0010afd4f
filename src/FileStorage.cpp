#include "roxfs/FileStorage.hpp"
#include "roxfs/FileSystemError.hpp"
#include <fstream>
#include <mutex>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "util/Log.hpp"

namespace roxfs
{

namespace fs = boost::filesystem;

class FileStorage: public IStorage
{
public:
  FileStorage(fs::path const & fileName)
    : m_fileName(fs::absolute(fileName))
  {
    m_stream.open(m_fileName, std::ios_base::binary | std::ios_base::in);
    if (!m_stream.is_open())
    {
      std::string const message = "Can't open " + m_fileName.string();
      ROXFS_LOG(error) << message;
      throw FileSystemError(ErrorCode::IoError, message.c_str());
    }
    m_stream.seekg(0, std::ios_base::end);
    m_size = static_cast<uint64_t>(m_stream.tellg());
    ROXFS_LOG(debug) << "Opened " << m_fileName.string() << ", " << m_size << " bytes";
  }

  uint64_t size() const override { return m_size; }

  void read(uint64_t position, size_t size, void * data) const override
  {
    if (position > m_size || size > m_size - position)
      throw FileSystemError(ErrorCode::IoError, "Read beyond end of image");

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.clear();
    m_stream.seekg(position);
    m_stream.read(reinterpret_cast<char *>(data), size);
    if (!m_stream || static_cast<size_t>(m_stream.gcount()) != size)
    {
      ROXFS_LOG(error) << "Short read at " << position << " from " << m_fileName.string();
      throw FileSystemError(ErrorCode::IoError, "Image read failed");
    }
  }

private:
  fs::path const m_fileName;
  mutable std::mutex m_mutex;
  mutable fs::ifstream m_stream;
  uint64_t m_size;
};

std::unique_ptr<IStorage> OpenFileStorage(const char * fileName)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName));
}

std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName));
}

}
