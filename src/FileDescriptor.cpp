#include "FileDescriptorImpl.hpp"
#include "roxfs/FileSystemError.hpp"

namespace roxfs
{

FileDescriptor::FileDescriptor()
  : m_impl(nullptr)
{}

FileDescriptor::FileDescriptor(FileDescriptor && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

FileDescriptor::FileDescriptor(FileDescriptor const & src)
  : m_impl(nullptr)
{
  if (src.m_impl)
    m_impl = new Impl(*src.m_impl);
}

FileDescriptor::~FileDescriptor()
{
  delete m_impl;
}

FileDescriptor & FileDescriptor::operator=(FileDescriptor const & src)
{
  if (this == &src)
    return *this;
  delete m_impl;
  if (src.m_impl)
    m_impl = new Impl(*src.m_impl);
  else
    m_impl = nullptr;
  return *this;
}

FileDescriptor & FileDescriptor::operator=(FileDescriptor && src)
{
  delete m_impl;
  m_impl = src.m_impl;
  src.m_impl = nullptr;
  return *this;
}

bool FileDescriptor::isOpen() const
{
  return m_impl != nullptr && m_impl->ptr->isOpen();
}

// Closes every copy of the descriptor
void FileDescriptor::close()
{
  if (m_impl)
  {
    m_impl->ptr->close();
    delete m_impl;
    m_impl = nullptr;
  }
}

[[noreturn]]
inline void ThrowNotOpened()
{
  throw FileSystemError(ErrorCode::InvalidOperation, "File isn't opened");
}

uint64_t FileDescriptor::inode() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->ptr->file()->inode();
}

uint64_t FileDescriptor::size() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->ptr->file()->size();
}

void FileDescriptor::seek(uint64_t position)
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->ptr->file()->seek(position);
}

uint64_t FileDescriptor::position() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->ptr->file()->position();
}

void FileDescriptor::read(size_t & inOutSize, void * buffer)
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->ptr->file()->read(inOutSize, buffer);
}

size_t FileDescriptor::pread(uint64_t position, size_t size, void * buffer) const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->ptr->file()->pread(position, size, buffer);
}

}
