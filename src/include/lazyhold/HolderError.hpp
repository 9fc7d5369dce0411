#pragma once

#include <stdexcept>
#include <string>

/* failures raised by a holder itself, factory exceptions pass through untouched */
class HolderError : public std::runtime_error
{
public:
  HolderError(const std::string &holder, const std::string &what)
    : std::runtime_error(holder + ": " + what), holder_(holder) {}

  const std::string &holder() const { return holder_; }

private:
  std::string holder_;
};

class NullInstanceError : public HolderError
{
public:
  explicit NullInstanceError(const std::string &holder)
    : HolderError(holder, "factory returned an empty instance") {}
};

class RecursiveInitError : public HolderError
{
public:
  explicit RecursiveInitError(const std::string &holder)
    : HolderError(holder, "getInstance() re-entered from its own factory") {}
};
