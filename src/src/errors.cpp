#include <ds/errors.h>
#include <ds/descriptor.h>
#include <sstream>

namespace ds {

namespace {
    std::string value_preview(const Dictionary& d, size_t maxlen = 80) {
        std::string s = d.dump();
        if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
        return s;
    }

    std::string name_of(const DescriptorPtr& target) { return target ? target->name : std::string("<none>"); }
}

std::string DecodeError::context(const std::string& path, const std::string& target_name, const Dictionary& value) {
    return "path: " + path + ", target: " + target_name + ", value: " + value_preview(value);
}

DecodeError::DecodeError(Dictionary value, DescriptorPtr target, std::string path)
    : DecodeError(context(path, name_of(target), value), value, target, name_of(target), path) {}

DecodeError::DecodeError(const std::string& message, Dictionary value, DescriptorPtr target, std::string target_name,
                         std::string path)
    : std::runtime_error(message),
      m_value(std::move(value)),
      m_target(std::move(target)),
      m_target_name(std::move(target_name)),
      m_path(std::move(path)) {}

namespace {
    std::string format_attrs(const std::set<std::string>& attrs) {
        std::ostringstream ss;
        ss << "[";
        bool first = true;
        for (auto const& a : attrs) {
            if (!first) ss << ", ";
            first = false;
            ss << "'" << a << "'";
        }
        ss << "]";
        return ss.str();
    }
}

MissingRequiredAttributeError::MissingRequiredAttributeError(Dictionary value, DescriptorPtr target, std::string path,
                                                             std::set<std::string> attrs)
    : DecodeError(context(path, name_of(target), value) + ", attrs: " + format_attrs(attrs), value, target,
                  name_of(target), path),
      m_attrs(std::move(attrs)) {}

WrongCollectionItemError::WrongCollectionItemError(Dictionary value, DescriptorPtr target, std::string path,
                                                   std::exception_ptr cause)
    : DecodeError(std::move(value), std::move(target), std::move(path)), m_cause(std::move(cause)) {}

namespace {
    std::string format_details(const std::vector<WrongCollectionItemError>& details) {
        std::string out;
        for (auto const& d : details) {
            out += "\n- ";
            out += d.what();
        }
        return out;
    }
}

WrongCollectionError::WrongCollectionError(Dictionary value, DescriptorPtr target, std::string path,
                                           std::vector<WrongCollectionItemError> details)
    : DecodeError(context(path, name_of(target), value) + ", details:" + format_details(details), value, target,
                  name_of(target), path),
      m_details(std::move(details)) {}

NotSupportedTypeError::NotSupportedTypeError(std::string target_name, std::string path)
    : DecodeError(context(path, target_name, Dictionary::null()), Dictionary::null(), nullptr, target_name, path) {}

TypeCompileError::TypeCompileError(std::string target_name, std::string path, const std::string& reason)
    : std::logic_error("target: " + target_name + ", path: " + path + ": " + reason),
      m_target_name(std::move(target_name)),
      m_path(std::move(path)) {}

NotAllowedTypeError::NotAllowedTypeError(std::string target_name, std::string path, const std::string& reason)
    : TypeCompileError(std::move(target_name), std::move(path), reason) {}

NotEncodableError::NotEncodableError(const std::string& type_name)
    : std::runtime_error("Object of " + type_name + " cannot be encoded as dictionary"), m_type_name(type_name) {}

}  // namespace ds
