#include "peel/layer.hpp"

#include "peel/archive_spec.hpp"

namespace peel {

const char* LayerName(Layer layer) {
    switch (layer) {
        case Layer::Gzip:          return "gzip";
        case Layer::Bzip2:         return "bzip2";
        case Layer::Xz:            return "xz";
        case Layer::Lzma:          return "lzma";
        case Layer::Compress:      return "compress";
        case Layer::Lrzip:         return "lrzip";
        case Layer::Lzip:          return "lzip";
        case Layer::Brotli:        return "brotli";
        case Layer::Zstd:          return "zstd";
        case Layer::Tar:           return "tar";
        case Layer::Zip:           return "zip";
        case Layer::Cpio:          return "cpio";
        case Layer::Rpm:           return "rpm";
        case Layer::Deb:           return "deb";
        case Layer::Gem:           return "gem";
        case Layer::SevenZip:      return "7z";
        case Layer::Cab:           return "cab";
        case Layer::Rar:           return "rar";
        case Layer::Lzh:           return "lzh";
        case Layer::Arj:           return "arj";
        case Layer::InstallShield: return "installshield";
        case Layer::Msi:           return "msi";
        case Layer::Dmg:           return "dmg";
    }
    return "unknown";
}

const char* ModeName(Mode mode) {
    switch (mode) {
        case Mode::Extract:  return "extract";
        case Mode::List:     return "list";
        case Mode::Metadata: return "metadata";
    }
    return "unknown";
}

std::string DescribeLayers(const std::vector<Layer>& layers) {
    std::string out;
    for (const Layer layer : layers) {
        if (!out.empty()) out += '+';
        out += LayerName(layer);
    }
    return out;
}

} // namespace peel
