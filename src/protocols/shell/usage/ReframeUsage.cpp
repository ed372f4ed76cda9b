#include "protocols/shell/usage/ReframeUsage.hpp"

using namespace rf::protocols::shell;

CommandBook ReframeUsage::all() {
    CommandBook book;
    book.title = "reframe - resize images to AVIF or JPEG";
    book.commands = {
        convert(),
        serve(),
        help(),
        version()
    };
    book.globals = globals();
    return book;
}

CommandUsage ReframeUsage::convert() {
    CommandUsage cmd;
    cmd.command = "convert";
    cmd.description = "Resize one image and write it to a file.";
    cmd.positionals = {
        {"<source>", "Image to read (any format stb_image decodes)"},
        {"<output>", "File to write; its extension picks the encoding unless --encoding is given"}
    };
    cmd.optional = {
        {"--width <W>", "Target width; height follows the aspect ratio unless --height is also given"},
        {"--height <H>", "Target height; width follows the aspect ratio unless --width is also given"},
        {"--scale <S>", "Uniform scale factor, e.g. 0.5 or 2.5. Excludes --width and --height"},
        {"--encoding <avif|jpeg>", "Output encoding (default: from the output extension, else avif)"}
    };
    cmd.examples.push_back({"reframe convert photo.jpg --width 800 photo-800.avif", "Resize to 800px wide, AVIF."});
    cmd.examples.push_back({"reframe --quality 75 convert scan.png --scale 0.5 scan.jpg", "Halve, JPEG at quality 75."});
    return cmd;
}

CommandUsage ReframeUsage::serve() {
    CommandUsage cmd;
    cmd.command = "serve";
    cmd.description = "Run the HTTP resize service.";
    cmd.optional = {
        {"--addr <HOST:PORT>", "Listen address (default: 0.0.0.0:3000)"},
        {"--images <DIR>", "Directory images are served from (default: images)"},
        {"--concurrency <N>", "Maximum pipeline runs in flight (default: 50)"},
        {"--workers <N>", "Pipeline worker threads (default: hardware concurrency)"}
    };
    cmd.examples.push_back({"reframe serve --addr 127.0.0.1:8080 --images /srv/images", ""});
    cmd.examples.push_back({"curl localhost:3000/images/resized/width/640/cat.jpg/jpeg -o cat.jpg",
                            "Fetch cat.jpg 640px wide as JPEG."});
    return cmd;
}

CommandUsage ReframeUsage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.aliases = {"--help", "-h"};
    cmd.description = "Show help for all commands or for one.";
    cmd.optional = {{"<command>", "Command to describe"}};
    return cmd;
}

CommandUsage ReframeUsage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.aliases = {"--version", "-v"};
    cmd.description = "Print the reframe version.";
    return cmd;
}

std::vector<Entry> ReframeUsage::globals() {
    return {
        {"--quality <Q>", "Encoder quality 1-100 (default: 90)"},
        {"--speed <S>", "AVIF encoder speed 1-10, lower is smaller and slower (default: 4)"},
        {"--filter <NAME>", "box, bilinear, cubicbspline, catmullrom or mitchell (default: catmullrom)"},
        {"--config <PATH>", "YAML config file (default: /etc/reframe/config.yaml when present)"},
        {"--log-level <LEVEL>", "Console log level: trace, debug, info, warn, error, critical, off"}
    };
}
