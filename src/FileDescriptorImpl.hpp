#pragma once

#include <memory>
#include "roxfs/FileDescriptor.hpp"
#include "File.hpp"

namespace roxfs
{

class FileSystemImpl;

class FileDescriptorImpl
{
public:
  FileDescriptorImpl(std::unique_ptr<File> && file, std::shared_ptr<FileSystemImpl> const & owner)
    : m_owner(owner)
    , m_file(std::move(file))
  {}

  bool isOpen() const
  {
    return bool(m_file);
  }

  // File refers to the volume of the owner, so it goes first
  void close()
  {
    m_file.reset();
    m_owner.reset();
  }

  File * file() { return m_file.get(); }

private:
  std::shared_ptr<FileSystemImpl> m_owner;
  std::unique_ptr<File> m_file;
};

class FileDescriptor::Impl
{
public:
  std::shared_ptr<FileDescriptorImpl> ptr;
};

class FileDescriptorFactory
{
public:
  static FileDescriptor create(std::shared_ptr<FileDescriptorImpl> && impl)
  {
    FileDescriptor descriptor;
    descriptor.m_impl = new FileDescriptor::Impl;
    descriptor.m_impl->ptr = std::move(impl);
    return descriptor;
  }
};

}
