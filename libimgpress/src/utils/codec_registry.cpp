#include "../../include/codec_registry.hpp"
#include "../../include/bmp_codec.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/tiff_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <algorithm>
#include <cctype>

namespace imgpress {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<TiffCodec>());
    codecs_.push_back(std::make_unique<BmpCodec>());
}

std::vector<ICodec*> CodecRegistry::find_by_mime(const std::string& mime) const {
    std::vector<ICodec*> result;
    for (const auto& codec : codecs_) {
        for (const auto supported_mime : codec->get_supported_mime_types()) {
            if (supported_mime == mime) {
                result.push_back(codec.get());
            }
        }
    }
    return result;
}

std::vector<ICodec*> CodecRegistry::find_by_extension(const std::string& ext) const {
    std::vector<ICodec*> result;
    if (ext.empty() || ext[0] != '.') return result;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& codec : codecs_) {
        for (const auto supported_ext : codec->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                result.push_back(codec.get());
            }
        }
    }
    return result;
}

ICodec* CodecRegistry::find_by_format(const ImageFormat format) const {
    const auto it = std::ranges::find_if(codecs_, [format](const auto& codec) {
        return codec->get_format() == format;
    });
    return it != codecs_.end() ? it->get() : nullptr;
}

ICodec* CodecRegistry::resolve_decoder(const std::filesystem::path& path) const {
    const auto mime = MimeDetector::detect(path);
    auto candidates = find_by_mime(mime);
    if (candidates.empty()) {
        candidates = find_by_extension(path.extension().string());
        if (!candidates.empty()) {
            Logger::log(LogLevel::Debug,
                        "MIME '" + mime + "' not recognized, using extension for " + path.filename().string(),
                        "registry");
        }
    }
    return candidates.empty() ? nullptr : candidates.front();
}

} // namespace imgpress
