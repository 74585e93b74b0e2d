#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>
#include <type_traits>

namespace {

struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

} // namespace

std::string imgpress::MimeDetector::detect(const std::filesystem::path& path)
{
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0)
    {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}
