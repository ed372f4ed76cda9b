#include "protocols/shell/commands.hpp"
#include "image/Pipeline.hpp"
#include "image/Error.hpp"
#include "util/files.hpp"
#include "util/parse.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>

using namespace rf;
using namespace rf::protocols::shell;
using namespace rf::image::model;

namespace {

// Present-but-empty counts as given so "--width" without a value is an error.
Lookup<unsigned int> dimensionArg(const CommandCall& call, const std::string& key) {
    Lookup<unsigned int> out;
    const auto v = optVal(call, key);
    if (!v) return out;
    if (const auto n = util::parseUInt(*v)) out.ptr = std::make_shared<unsigned int>(*n);
    else out.error = fmt::format("--{} expects an unsigned integer, got '{}'", key, *v);
    return out;
}

}

std::optional<Encoding> rf::protocols::shell::encodingFromExtension(const std::filesystem::path& output) {
    auto ext = output.extension().string();
    if (ext.empty()) return std::nullopt;
    ext.erase(ext.begin()); // leading '.'
    return parseEncoding(ext);
}

Lookup<ConvertArgs> rf::protocols::shell::parseConvertArgs(const CommandCall& call) {
    Lookup<ConvertArgs> out;

    if (call.positionals.size() != 2) {
        out.error = fmt::format("convert expects <source> and <output>, got {} argument(s)", call.positionals.size());
        return out;
    }

    const bool hasWidth = hasKey(call, "width");
    const bool hasHeight = hasKey(call, "height");
    const bool hasScale = hasKey(call, "scale");

    if (hasScale && (hasWidth || hasHeight)) {
        out.error = "--scale cannot be combined with --width or --height";
        return out;
    }
    if (!hasScale && !hasWidth && !hasHeight) {
        out.error = "one of --width, --height or --scale is required";
        return out;
    }

    std::optional<ResizeSpec> to;

    if (hasScale) {
        const auto raw = optVal(call, "scale").value_or("");
        const auto factor = util::parseDouble(raw);
        if (!factor) {
            out.error = fmt::format("--scale expects a number, got '{}'", raw);
            return out;
        }
        to = Scale{*factor};
    } else {
        const auto w = dimensionArg(call, "width");
        if (hasWidth && !w) { out.error = w.error; return out; }
        const auto h = dimensionArg(call, "height");
        if (hasHeight && !h) { out.error = h.error; return out; }

        if (w && h) to = WidthAndHeight{*w.ptr, *h.ptr};
        else if (w) to = Width{*w.ptr};
        else to = Height{*h.ptr};
    }

    const std::filesystem::path output = call.positionals[1];

    Encoding encoding = Encoding::Avif;
    if (const auto raw = optVal(call, "encoding")) {
        const auto e = parseEncoding(*raw);
        if (!e) {
            out.error = fmt::format("--encoding must be avif or jpeg, got '{}'", *raw);
            return out;
        }
        encoding = *e;
    } else if (const auto e = encodingFromExtension(output)) {
        encoding = *e;
    }

    out.ptr = std::make_shared<ConvertArgs>(ConvertArgs{call.positionals[0], output, *to, encoding});
    return out;
}

CommandResult rf::protocols::shell::convert(const CommandCall& call, const EncodeConfig& encoding) {
    const auto args = parseConvertArgs(call);
    if (!args) return invalid("convert", args.error);

    try {
        const image::Pipeline pipeline(encoding);
        const auto encoded = pipeline.process(args.ptr->source, args.ptr->to, args.ptr->encoding);
        util::writeFile(args.ptr->output, encoded.bytes);

        log::Registry::shell()->info("[convert] {} -> {} ({}, {} bytes)", args.ptr->source.string(),
                                     args.ptr->output.string(), args.ptr->to.describe(), encoded.bytes.size());
        return ok("");
    } catch (const image::Error& e) {
        log::Registry::shell()->error("[convert] {}: {}", args.ptr->source.string(), e.what());
        return failed(fmt::format("{}: {}", args.ptr->source.string(), e.what()));
    } catch (const std::exception& e) {
        log::Registry::shell()->error("[convert] {}", e.what());
        return failed(e.what());
    }
}
