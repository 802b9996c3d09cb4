#pragma once

#include <ds/dictionary.h>
#include <exception>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ds {

struct Descriptor;
using DescriptorPtr = std::shared_ptr<const Descriptor>;

// Base of every failure reported for a particular input value. Carries the
// offending value, the expected target and the path where decoding failed.
// `target()` is null only when the failure happened while resolving a schema
// (see NotSupportedTypeError); `targetName()` is always set.
class DecodeError : public std::runtime_error {
  public:
    DecodeError(Dictionary value, DescriptorPtr target, std::string path);

    const Dictionary& value() const noexcept { return m_value; }
    const DescriptorPtr& target() const noexcept { return m_target; }
    const std::string& targetName() const noexcept { return m_target_name; }
    const std::string& path() const noexcept { return m_path; }

  protected:
    DecodeError(const std::string& message, Dictionary value, DescriptorPtr target, std::string target_name,
                std::string path);

    // "path: <path>, target: <target>, value: <preview>"
    static std::string context(const std::string& path, const std::string& target_name, const Dictionary& value);

  private:
    Dictionary m_value;
    DescriptorPtr m_target;
    std::string m_target_name;
    std::string m_path;
};

// Required fields absent from the input object.
class MissingRequiredAttributeError : public DecodeError {
  public:
    MissingRequiredAttributeError(Dictionary value, DescriptorPtr target, std::string path,
                                  std::set<std::string> attrs);

    const std::set<std::string>& attrs() const noexcept { return m_attrs; }

  private:
    std::set<std::string> m_attrs;
};

// The runtime kind of the value does not satisfy the expected shape.
class WrongTypeError : public DecodeError {
  public:
    using DecodeError::DecodeError;
};

// One element of a sequence failed. The message names only the element; the
// error raised inside the element is available through cause().
class WrongCollectionItemError : public DecodeError {
  public:
    WrongCollectionItemError(Dictionary value, DescriptorPtr target, std::string path,
                             std::exception_ptr cause = nullptr);

    const std::exception_ptr& cause() const noexcept { return m_cause; }

  private:
    std::exception_ptr m_cause;
};

// At least one element of a sequence failed; one detail per failing element
// in index order.
class WrongCollectionError : public DecodeError {
  public:
    WrongCollectionError(Dictionary value, DescriptorPtr target, std::string path,
                         std::vector<WrongCollectionItemError> details);

    const std::vector<WrongCollectionItemError>& details() const noexcept { return m_details; }

  private:
    std::vector<WrongCollectionItemError> m_details;
};

// The target has no decode rule: an opaque type without a registered
// decoder, or a container shape other than std::vector (raised while the
// schema is resolved, with a null value).
class NotSupportedTypeError : public DecodeError {
  public:
    using DecodeError::DecodeError;
    NotSupportedTypeError(std::string target_name, std::string path);
};

// The schema itself is unusable, independent of any input.
class TypeCompileError : public std::logic_error {
  public:
    TypeCompileError(std::string target_name, std::string path, const std::string& reason);

    const std::string& targetName() const noexcept { return m_target_name; }
    const std::string& path() const noexcept { return m_path; }

  private:
    std::string m_target_name;
    std::string m_path;
};

// A field declares a type that cannot be decoded unambiguously, or a
// structure refers to itself.
class NotAllowedTypeError : public TypeCompileError {
  public:
    NotAllowedTypeError(std::string target_name, std::string path, const std::string& reason = "not allowed");
};

// Raised by the encode path when no conversion applies to an object.
class NotEncodableError : public std::runtime_error {
  public:
    explicit NotEncodableError(const std::string& type_name);

    const std::string& typeName() const noexcept { return m_type_name; }

  private:
    std::string m_type_name;
};

}  // namespace ds
