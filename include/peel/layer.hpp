#pragma once

#include <string>
#include <vector>

namespace peel {

// One encoding layer of an archive. Compression filters come first in this
// enumeration; every value from Tar on is a container.
enum class Layer : int {
    Gzip,
    Bzip2,
    Xz,
    Lzma,
    Compress,
    Lrzip,
    Lzip,
    Brotli,
    Zstd,

    Tar,
    Zip,
    Cpio,
    Rpm,
    Deb,
    Gem,
    SevenZip,
    Cab,
    Rar,
    Lzh,
    Arj,
    InstallShield,
    Msi,
    Dmg,
};

inline bool IsCompressionFilter(Layer layer) { return layer < Layer::Tar; }
inline bool IsContainer(Layer layer) { return !IsCompressionFilter(layer); }

const char* LayerName(Layer layer);

// "gzip+tar" style rendering for log lines.
std::string DescribeLayers(const std::vector<Layer>& layers);

} // namespace peel
