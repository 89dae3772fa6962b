// formatter.cpp - DiffRecord rendering (json / yaml / diffx)

#include <diffx/formatter.h>
#include <diffx/builders.h>
#include <diffx/error.h>
#include <diffx/serialization.h>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>

namespace diffx {

namespace {

namespace keys {
    inline constexpr const char* diff_type = "diffType";
    inline constexpr const char* path      = "path";
    inline constexpr const char* old_value = "oldValue";
    inline constexpr const char* new_value = "newValue";
    inline constexpr const char* value     = "value";
}

// ============================================================
// yaml
// ============================================================

void emit_yaml(YAML::Emitter& out, const Value& val)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            out << YAML::Null;
        } else if constexpr (std::is_same_v<T, bool>) {
            out << YAML::TrueFalseBool << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isnan(arg)) {
                out << ".nan";
            } else if (std::isinf(arg)) {
                out << (arg < 0 ? "-.inf" : ".inf");
            } else {
                out << number_to_string(arg);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            // Quoted so that "30" or "true" read back as strings
            out << YAML::DoubleQuoted << arg;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.empty()) out << YAML::Flow;
            out << YAML::BeginMap;
            for (const auto& [k, v] : arg) {
                out << YAML::Key << k << YAML::Value;
                emit_yaml(out, *v);
            }
            out << YAML::EndMap;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) out << YAML::Flow;
            out << YAML::BeginSeq;
            for (const auto& v : arg) {
                emit_yaml(out, *v);
            }
            out << YAML::EndSeq;
        }
    }, val.data);
}

std::string format_yaml(const std::vector<DiffRecord>& records)
{
    if (records.empty()) {
        return "[]";
    }
    YAML::Emitter out;
    emit_yaml(out, records_to_value(records));
    if (!out.good()) {
        throw Error("yaml emitter: " + out.GetLastError());
    }
    return out.c_str();
}

// ============================================================
// diffx
// ============================================================

std::string format_diffx(const std::vector<DiffRecord>& records)
{
    std::ostringstream oss;
    for (const auto& rec : records) {
        const std::string& path = rec.path.empty() ? std::string("(root)") : rec.path;
        switch (rec.type) {
            case DiffRecord::Type::Added:
                oss << "+ " << path << ": " << to_json(rec.new_value, true);
                break;
            case DiffRecord::Type::Removed:
                oss << "- " << path << ": " << to_json(rec.old_value, true);
                break;
            case DiffRecord::Type::Modified:
                oss << "~ " << path << ": " << to_json(rec.old_value, true)
                    << " -> " << to_json(rec.new_value, true);
                break;
            case DiffRecord::Type::TypeChanged:
                oss << "! " << path << ": " << to_json(rec.old_value, true)
                    << " -> " << to_json(rec.new_value, true);
                break;
        }
        oss << "\n";
    }
    return oss.str();
}

// ============================================================
// json -> records
// ============================================================

[[noreturn]] void fail(const std::string& message)
{
    detail::log_access_error("records_from_json", message);
    throw ParseError("json", message);
}

const Value& require(const ValueMap& obj, const char* key, const std::string& message)
{
    auto* found = obj.find(key);
    if (!found) fail(message);
    return found->get();
}

DiffRecord record_from_value(const Value& item, std::size_t index)
{
    const auto* obj = item.get_if<ValueMap>();
    if (!obj) {
        fail("result " + std::to_string(index) + " must be an object");
    }

    const Value& type_val = require(*obj, keys::diff_type, "result must have diffType");
    const Value& path_val = require(*obj, keys::path, "result must have path");
    if (!type_val.is_string()) fail("diffType must be a string");
    if (!path_val.is_string()) fail("path must be a string");

    const std::string& type = *type_val.get_if<std::string>();
    std::string path = path_val.as_string();

    if (type == "Added") {
        return DiffRecord::added(std::move(path),
                                 require(*obj, keys::new_value, "Added result must have newValue"));
    }
    if (type == "Removed") {
        return DiffRecord::removed(std::move(path),
                                   require(*obj, keys::value, "Removed result must have value"));
    }
    if (type == "Modified") {
        return DiffRecord::modified(std::move(path),
                                    require(*obj, keys::old_value, "Modified result must have oldValue"),
                                    require(*obj, keys::new_value, "Modified result must have newValue"));
    }
    if (type == "TypeChanged") {
        return DiffRecord::type_changed(std::move(path),
                                        require(*obj, keys::old_value, "TypeChanged result must have oldValue"),
                                        require(*obj, keys::new_value, "TypeChanged result must have newValue"));
    }
    fail("unknown diffType '" + type + "'");
}

} // anonymous namespace

Value records_to_value(const std::vector<DiffRecord>& records)
{
    VectorBuilder items;
    for (const auto& rec : records) {
        MapBuilder obj;
        obj.set(keys::diff_type, Value{to_string(rec.type)});
        obj.set(keys::path, Value{rec.path});
        switch (rec.type) {
            case DiffRecord::Type::Added:
                obj.set(keys::new_value, rec.new_value);
                break;
            case DiffRecord::Type::Removed:
                obj.set(keys::value, rec.old_value);
                break;
            case DiffRecord::Type::Modified:
            case DiffRecord::Type::TypeChanged:
                obj.set(keys::old_value, rec.old_value);
                obj.set(keys::new_value, rec.new_value);
                break;
        }
        items.push_back(obj.finish());
    }
    return items.finish();
}

std::string format_output(const std::vector<DiffRecord>& records, OutputFormat format)
{
    switch (format) {
        case OutputFormat::Json:
            return to_json(records_to_value(records));
        case OutputFormat::Yaml:
            return format_yaml(records);
        case OutputFormat::Diffx:
            return format_diffx(records);
    }
    throw UnsupportedFormat(std::to_string(static_cast<int>(format)));
}

std::string format_output(const std::vector<DiffRecord>& records, std::string_view format)
{
    return format_output(records, parse_output_format(format));
}

std::vector<DiffRecord> records_from_json(std::string_view json)
{
    const Value parsed = from_json(json);
    const auto* items = parsed.get_if<ValueVector>();
    if (!items) {
        fail("expected an array of results");
    }

    std::vector<DiffRecord> records;
    records.reserve(items->size());
    for (std::size_t i = 0; i < items->size(); ++i) {
        records.push_back(record_from_value(*(*items)[i], i));
    }
    return records;
}

std::string render(const std::vector<DiffRecord>& records, const DiffOptions& options)
{
    if (options.quiet_mode()) {
        return {};
    }
    if (options.brief_mode()) {
        return records.empty() ? std::string{} : std::string{"Objects differ\n"};
    }
    return format_output(records, std::string_view{options.output_format()});
}

ExitStatus exit_status(const std::vector<DiffRecord>& records) noexcept
{
    return records.empty() ? ExitStatus::NoDifferences : ExitStatus::DifferencesFound;
}

} // namespace diffx
