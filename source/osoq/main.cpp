#include <osoquery/parser_utils.hpp>
#include <osoquery/reader.hpp>
#include <osoquery/result.hpp>
#include <osoquery/shader_record.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace osoquery;

// ============================================================
// Logging
// ============================================================

static bool g_verbose = false;

static void log_info(const std::string& s) { std::cout << "[osoq] " << s << std::endl; }

static void log_verbose(const std::string& s)
{
    if (g_verbose)
        std::cout << "[osoq][verbose] " << s << std::endl;
}

static void log_error(const std::string& s) { std::cerr << "[osoq][error] " << s << std::endl; }

// ============================================================
// Usage
// ============================================================

static void print_usage()
{
    std::cout <<
        R"(osoq - query compiled shader (.oso) parameters

Usage:
  osoq [options] <shader> [<shader> ...]

Each <shader> is a path, with or without the .oso extension. Files that
fail to parse are reported and skipped; the exit code is 2 if any failed.

Options:
  -p, --searchpath <a:b>  Colon-separated directories to search for shaders
  --param <name>          Only show the named parameter
  -v, --verbose           Verbose listing (one block per parameter, with metadata)
  --runstats              Report parse time per file
  -h, --help              Show this help

Examples:
  osoq shaders/matte.oso
  osoq -p /opt/shaders:/usr/local/shaders --param Kd matte plastic
)";
}

// ============================================================
// Utility
// ============================================================

static std::vector<std::string> split_search_path(const std::string& s)
{
    std::vector<std::string> out;
    std::string              cur;
    for (char c : s)
    {
        if (c == ':' || c == ';')
        {
            if (!cur.empty())
                out.push_back(cur);
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    if (!cur.empty())
        out.push_back(cur);
    return out;
}

static bool is_regular_file(const std::filesystem::path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

// name.oso is preferred over a bare name, then each search directory is tried the same way.
static Result<std::string> find_oso_file(const std::string& name, const std::vector<std::string>& searchDirs)
{
    auto try_path = [](const std::filesystem::path& p, std::string& out) {
        if (p.extension() != ".oso")
        {
            auto withExt = p;
            withExt += ".oso";
            if (::is_regular_file(withExt))
            {
                out = withExt.generic_string();
                return true;
            }
        }
        if (::is_regular_file(p))
        {
            out = p.generic_string();
            return true;
        }
        return false;
    };

    std::string found;
    if (try_path(name, found))
        return Result<std::string>::ok(found);

    for (const auto& dir : searchDirs)
    {
        if (try_path(std::filesystem::path(dir) / name, found))
            return Result<std::string>::ok(found);
    }

    return Result<std::string>::err({ErrorCode::eIO, "shader file not found: " + name, 0});
}

static std::string format_float(float v)
{
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

// Values of one element group; aggregates in arrays are bracketed per element.
static std::string format_value(const ShaderRecord& rec, const ParameterValue& v, const TypeDescriptor& type)
{
    std::vector<std::string> items;
    switch (v.kind)
    {
        case ValueKind::eInt:
            for (int32_t i : v.ints)
                items.push_back(std::to_string(i));
            break;
        case ValueKind::eFloat:
            for (float f : v.floats)
                items.push_back(format_float(f));
            break;
        case ValueKind::eString:
            for (StringId s : v.strings)
                items.push_back("\"" + escape_string(rec.text(s)) + "\"");
            break;
    }

    const size_t components = base_type_components(type.base);

    std::string out;
    if (items.size() == 1 && !type.isArray())
        return items.front();

    out += "[";
    for (size_t i = 0; i < items.size(); ++i)
    {
        const bool groupStart = type.isArray() && components > 1 && (i % components) == 0;
        if (i > 0)
            out += " ";
        if (groupStart)
            out += "[";
        out += items[i];
        if (type.isArray() && components > 1 && (i % components) == components - 1)
            out += "]";
    }
    out += "]";
    return out;
}

static std::string format_default(const ShaderRecord& rec, const Parameter& p)
{
    if (!p.hasDefault)
        return "<no default>";
    return format_value(rec, p.defaultValue, p.type);
}

static std::string format_metadata(const ShaderRecord& rec, const Metadata& m)
{
    std::string s = base_type_name(m.type.base);
    if (m.value.size() > base_type_components(m.type.base))
        s += "[]";
    s += " " + std::string(rec.text(m.key)) + " =";

    switch (m.value.kind)
    {
        case ValueKind::eInt:
            for (int32_t i : m.value.ints)
                s += " " + std::to_string(i);
            break;
        case ValueKind::eFloat:
            for (float f : m.value.floats)
                s += " " + format_float(f);
            break;
        case ValueKind::eString:
            for (StringId id : m.value.strings)
                s += " \"" + escape_string(rec.text(id)) + "\"";
            break;
    }
    return s;
}

// ============================================================
// Listing
// ============================================================

static void print_record(const ShaderRecord& rec, const std::string& paramFilter)
{
    std::cout << rec.shaderType() << " \"" << escape_string(rec.name()) << "\"" << std::endl;

    for (const auto& m : rec.metadata())
        std::cout << "    metadata: " << format_metadata(rec, m) << std::endl;

    std::vector<const Parameter*> shown;
    for (const auto& p : rec.parameters())
    {
        if (!paramFilter.empty() && rec.text(p.name) != paramFilter)
            continue;
        shown.push_back(&p);
    }

    size_t nameWidth = 0;
    size_t typeWidth = 0;
    for (const Parameter* p : shown)
    {
        nameWidth = std::max(nameWidth, rec.text(p->name).size());
        typeWidth = std::max(typeWidth, type_descriptor_name(p->type).size() + (p->isOutput() ? 7 : 0));
    }

    for (const Parameter* p : shown)
    {
        const std::string name(rec.text(p->name));
        std::string       type = type_descriptor_name(p->type);
        if (p->isOutput())
            type = "output " + type;

        if (g_verbose)
        {
            std::cout << "    \"" << name << "\" \"" << type << "\"" << std::endl;
            std::cout << "\t\tDefault value: " << format_default(rec, *p) << std::endl;
            if (p->space != kInvalidStringId)
                std::cout << "\t\tspace: \"" << escape_string(rec.text(p->space)) << "\"" << std::endl;
            if (p->structName != kInvalidStringId)
                std::cout << "\t\tstruct: " << rec.text(p->structName) << std::endl;
            for (const auto& m : p->metadata)
                std::cout << "\t\tmetadata: " << format_metadata(rec, m) << std::endl;
            continue;
        }

        std::cout << "    " << name << std::string(nameWidth - name.size() + 2, ' ') << type
                  << std::string(typeWidth - type.size() + 2, ' ') << format_default(rec, *p) << std::endl;
    }
}

// ============================================================
// main
// ============================================================

int main(int argc, char** argv)
{
    std::vector<std::string> files;
    std::vector<std::string> searchDirs;
    std::string              paramFilter;
    bool                     runStats = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return 0;
        }
        else if (a == "-p" || a == "--searchpath")
        {
            if (i + 1 >= argc)
            {
                log_error(a + " requires a value");
                return 1;
            }
            for (auto& d : split_search_path(argv[++i]))
                searchDirs.push_back(std::move(d));
        }
        else if (a == "--param")
        {
            if (i + 1 >= argc)
            {
                log_error("--param requires a parameter name");
                return 1;
            }
            paramFilter = argv[++i];
        }
        else if (a == "-v" || a == "--verbose")
        {
            g_verbose = true;
        }
        else if (a == "--runstats")
        {
            runStats = true;
        }
        else if (!a.empty() && a[0] == '-')
        {
            log_error("Unknown argument: " + a);
            print_usage();
            return 1;
        }
        else
        {
            files.push_back(a);
        }
    }

    if (files.empty())
    {
        log_error("No input shaders specified");
        print_usage();
        return 1;
    }

    size_t failed = 0;
    for (const auto& file : files)
    {
        auto path = find_oso_file(file, searchDirs);
        if (!path.isOk())
        {
            log_error(path.error().message);
            ++failed;
            continue;
        }
        log_verbose("reading " + path.value());

        auto start = std::chrono::steady_clock::now();
        auto rec   = load_oso_file(path.value());
        auto end   = std::chrono::steady_clock::now();

        if (!rec.isOk())
        {
            const auto& e = rec.error();
            std::string msg = path.value();
            if (e.line != 0)
                msg += ":" + std::to_string(e.line);
            log_error(msg + ": " + error_code_name(e.code) + ": " + e.message);
            ++failed;
            continue;
        }

        if (!paramFilter.empty() && rec.value().findParameter(paramFilter) == nullptr)
        {
            log_error(path.value() + ": parameter '" + paramFilter + "' not found");
            ++failed;
            continue;
        }

        print_record(rec.value(), paramFilter);

        if (runStats)
        {
            auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
            log_info("parse " + path.value() + " took " + std::to_string(us / 1000.0) + " ms");
        }
    }

    if (failed != 0)
    {
        log_error(std::to_string(failed) + " of " + std::to_string(files.size()) + " shader(s) failed");
        return 2;
    }
    return 0;
}
