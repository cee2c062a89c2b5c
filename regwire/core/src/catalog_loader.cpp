#include "regwire/core/catalog_loader.hpp"

#include "regwire/core/serde.hpp"
#include "regwire/core/type_ref.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace regwire::catalog_io {

namespace {

using serde::json_cursor;
using serde::parse_array_elements;
using serde::parse_bool;
using serde::parse_object_members;
using serde::parse_string;
using serde::parse_uint;

constexpr size_t kMaxTypeCount = 200000;

struct load_context {
    json_cursor cur;
    error_code failure = error_code::catalog_parse_error;
    std::string detail;
    std::string where = "catalog";

    explicit load_context(std::string_view text) : cur(text) {}

    bool fail(error_code code, std::string message) {
        failure = code;
        detail = where + ": " + std::move(message);
        return false;
    }

    bool malformed(std::string_view what) {
        return fail(error_code::catalog_parse_error,
                    std::string("malformed ") + std::string(what) + " at offset " +
                        std::to_string(cur.pos()));
    }
};

bool read_string(load_context& ctx, std::string& out, std::string_view what) {
    auto v = parse_string(ctx.cur);
    if (!v) {
        return ctx.malformed(what);
    }
    out = std::move(*v);
    return true;
}

bool read_bool(load_context& ctx, bool& out, std::string_view what) {
    auto v = parse_bool(ctx.cur);
    if (!v) {
        return ctx.malformed(what);
    }
    out = *v;
    return true;
}

bool read_uint(load_context& ctx, uint32_t& out, std::string_view what) {
    auto v = parse_uint(ctx.cur);
    if (!v) {
        return ctx.malformed(what);
    }
    out = *v;
    return true;
}

bool read_string_list(load_context& ctx, std::vector<std::string>& out, std::string_view what) {
    out.clear();
    bool ok = parse_array_elements(ctx.cur, [&] {
        std::string item;
        if (!read_string(ctx, item, what)) {
            return false;
        }
        out.push_back(std::move(item));
        return true;
    });
    if (!ok && ctx.detail.empty()) {
        return ctx.malformed(what);
    }
    return ok;
}

bool read_access(load_context& ctx, accessibility& out) {
    std::string text;
    if (!read_string(ctx, text, "access")) {
        return false;
    }
    auto access = accessibility_from_string(text);
    if (!access) {
        return ctx.fail(error_code::catalog_invalid, "unknown accessibility '" + text + "'");
    }
    out = *access;
    return true;
}

bool read_location(load_context& ctx, source_location& out) {
    bool ok = parse_object_members(ctx.cur, [&](std::string_view key) {
        if (key == "file") {
            return read_string(ctx, out.file, "location.file");
        }
        if (key == "line") {
            return read_uint(ctx, out.line, "location.line");
        }
        if (key == "column") {
            return read_uint(ctx, out.column, "location.column");
        }
        return ctx.cur.skip_value() || ctx.malformed("location");
    });
    if (!ok && ctx.detail.empty()) {
        return ctx.malformed("location");
    }
    return ok;
}

// A base entry is either "type text" or { "type": ..., "location": {...} }.
bool read_base(load_context& ctx, base_entry& out) {
    if (ctx.cur.peek('\"')) {
        return read_string(ctx, out.type, "base");
    }
    bool ok = parse_object_members(ctx.cur, [&](std::string_view key) {
        if (key == "type") {
            return read_string(ctx, out.type, "base.type");
        }
        if (key == "location") {
            return read_location(ctx, out.location);
        }
        return ctx.cur.skip_value() || ctx.malformed("base");
    });
    if (!ok) {
        return ctx.detail.empty() ? ctx.malformed("base") : false;
    }
    if (out.type.empty()) {
        return ctx.fail(error_code::catalog_invalid, "base entry without type");
    }
    return true;
}

bool read_constructor(load_context& ctx, constructor_decl& out) {
    bool ok = parse_object_members(ctx.cur, [&](std::string_view key) {
        if (key == "access") {
            return read_access(ctx, out.access);
        }
        if (key == "static") {
            return read_bool(ctx, out.is_static, "constructor.static");
        }
        return ctx.cur.skip_value() || ctx.malformed("constructor");
    });
    if (!ok && ctx.detail.empty()) {
        return ctx.malformed("constructor");
    }
    return ok;
}

bool read_type(load_context& ctx, type_decl& out) {
    bool ok = parse_object_members(ctx.cur, [&](std::string_view key) {
        if (key == "name") {
            return read_string(ctx, out.name, "name");
        }
        if (key == "kind") {
            std::string text;
            if (!read_string(ctx, text, "kind")) {
                return false;
            }
            auto kind = type_kind_from_string(text);
            if (!kind) {
                return ctx.fail(error_code::catalog_invalid, "unknown kind '" + text + "'");
            }
            out.kind = *kind;
            return true;
        }
        if (key == "access") {
            return read_access(ctx, out.access);
        }
        if (key == "abstract") {
            return read_bool(ctx, out.is_abstract, "abstract");
        }
        if (key == "static") {
            return read_bool(ctx, out.is_static, "static");
        }
        if (key == "sealed") {
            return read_bool(ctx, out.is_sealed, "sealed");
        }
        if (key == "unbound") {
            return read_bool(ctx, out.is_unbound, "unbound");
        }
        if (key == "type_parameters") {
            return read_string_list(ctx, out.type_parameters, "type_parameters");
        }
        if (key == "type_arguments") {
            return read_string_list(ctx, out.type_arguments, "type_arguments");
        }
        if (key == "bases") {
            out.bases.clear();
            bool bases_ok = parse_array_elements(ctx.cur, [&] {
                base_entry entry;
                if (!read_base(ctx, entry)) {
                    return false;
                }
                out.bases.push_back(std::move(entry));
                return true;
            });
            return bases_ok || (ctx.detail.empty() ? ctx.malformed("bases") : false);
        }
        if (key == "constructors") {
            std::vector<constructor_decl> ctors;
            bool ctors_ok = parse_array_elements(ctx.cur, [&] {
                constructor_decl ctor;
                if (!read_constructor(ctx, ctor)) {
                    return false;
                }
                ctors.push_back(ctor);
                return true;
            });
            if (!ctors_ok) {
                return ctx.detail.empty() ? ctx.malformed("constructors") : false;
            }
            out.constructors = std::move(ctors);
            return true;
        }
        if (key == "location") {
            return read_location(ctx, out.location);
        }
        return ctx.cur.skip_value() || ctx.malformed("type");
    });
    if (!ok) {
        return ctx.detail.empty() ? ctx.malformed("type") : false;
    }
    out.name = std::string(normalize_qualified_name(out.name));
    if (out.name.empty()) {
        return ctx.fail(error_code::catalog_invalid, "type without name");
    }
    if (!out.type_arguments.empty() && out.type_arguments.size() != out.type_parameters.size()) {
        return ctx.fail(error_code::catalog_invalid,
                        "type '" + out.name + "' has " + std::to_string(out.type_arguments.size()) +
                            " type arguments for " + std::to_string(out.type_parameters.size()) +
                            " type parameters");
    }
    return true;
}

bool read_types(load_context& ctx, catalog& cat) {
    size_t index = 0;
    bool ok = parse_array_elements(ctx.cur, [&] {
        if (cat.size() >= kMaxTypeCount) {
            return ctx.fail(error_code::catalog_invalid, "too many types");
        }
        ctx.where = "types[" + std::to_string(index) + "]";
        type_decl decl;
        if (!read_type(ctx, decl)) {
            return false;
        }
        std::string identity = decl.identity();
        if (!cat.add_type(std::move(decl))) {
            return ctx.fail(error_code::catalog_invalid, "duplicate type '" + identity + "'");
        }
        ++index;
        return true;
    });
    ctx.where = "catalog";
    if (!ok && ctx.detail.empty()) {
        return ctx.malformed("types");
    }
    return ok;
}

} // namespace

result<catalog> load_from_string(std::string_view text, std::string* error_detail) {
    auto report = [&](load_context& ctx) -> result<catalog> {
        if (error_detail) {
            *error_detail = ctx.detail;
        }
        return std::unexpected(make_error_code(ctx.failure));
    };

    load_context ctx(serde::trim_view(text));
    if (ctx.cur.eof()) {
        ctx.fail(error_code::catalog_parse_error, "empty document");
        return report(ctx);
    }

    catalog cat;
    bool saw_version = false;
    bool ok = parse_object_members(ctx.cur, [&](std::string_view key) {
        if (key == "catalog") {
            saw_version = true;
            return read_string(ctx, cat.version, "catalog version");
        }
        if (key == "types") {
            return read_types(ctx, cat);
        }
        return ctx.cur.skip_value() || ctx.malformed("document");
    });
    if (!ok) {
        if (ctx.detail.empty()) {
            ctx.malformed("document");
        }
        return report(ctx);
    }
    ctx.cur.skip_ws();
    if (!ctx.cur.eof()) {
        ctx.malformed("document (trailing content)");
        return report(ctx);
    }
    if (!saw_version) {
        ctx.fail(error_code::catalog_invalid, "missing catalog version");
        return report(ctx);
    }
    if (cat.version != kSupportedCatalogVersion) {
        ctx.fail(error_code::catalog_invalid,
                 "unsupported catalog version '" + cat.version + "' (expected " +
                     std::string(kSupportedCatalogVersion) + ")");
        return report(ctx);
    }
    return cat;
}

result<catalog> load_from_file(const char* path, std::string* error_detail) {
    auto io_failure = [&](std::string detail) -> result<catalog> {
        if (error_detail) {
            *error_detail = std::move(detail);
        }
        return std::unexpected(make_error_code(error_code::io_error));
    };

    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !std::filesystem::is_regular_file(path, ec)) {
        return io_failure(std::string("not a regular file: ") + path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return io_failure(std::string("cannot open ") + path);
    }
    std::string content;
    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    if (size < 0) {
        return io_failure(std::string("cannot determine size of ") + path);
    }
    content.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    in.read(content.data(), static_cast<std::streamsize>(content.size()));
    if (!in) {
        return io_failure(std::string("cannot read ") + path);
    }
    return load_from_string(content, error_detail);
}

} // namespace regwire::catalog_io
