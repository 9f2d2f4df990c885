#pragma once

#include "peel/archive_spec.hpp"
#include "peel/interaction_controller.hpp"
#include "system/scoped_temp_dir.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peel {

enum class ContentType {
    Empty,
    // A single entry whose name equals the base name.
    Matching,
    OneEntry,
    // Several top-level entries.
    Bomb,
};

struct StagedContents {
    ContentType type = ContentType::Empty;
    std::vector<std::string> entries; // top-level names, sorted
    bool entry_is_directory = false;  // Matching / OneEntry only
};

struct PlacementOptions {
    bool overwrite = false;
    bool flat = false;
};

// Output location of one extraction, fixed before any tool runs.
struct Destination {
    std::string parent;    // directory receiving the output
    std::string base_name; // preferred top-level name
    std::vector<std::string> produced;
    // Staged path and the path it was moved to, one pair per move.
    std::vector<std::pair<std::string, std::string>> moved;
};

class OutputPlacement {
  public:
    static constexpr int kMaxRenameAttempts = 1000;
    static constexpr const char* kStagingPrefix = ".peel-";

    explicit OutputPlacement(PlacementOptions opt) : opt_(opt) {}

    // Archive file name with its recognized suffix removed.
    static std::string StripArchiveSuffix(std::string_view filename);
    // Output name for `spec`, including the package naming conventions.
    static std::string BaseName(const ArchiveSpec& spec);

    static StagedContents Inspect(const std::string& staging_dir, const std::string& base_name);

    // Computes the destination and creates the private staging directory
    // inside `parent`.
    Result Prepare(const ArchiveSpec& spec, const std::string& parent, Destination& dest,
                   ScopedTempDir& staging) const;

    // Moves staged output to its final place. Claims names atomically.
    Result Place(const ArchiveSpec& spec, Destination& dest, ScopedTempDir& staging,
                 InteractionController& ui) const;

    // After a failed run: keeps whatever was extracted under a fresh name.
    Result PlacePartial(Destination& dest, ScopedTempDir& staging) const;

    // Claims `parent/name`, then `name-1`, `name-2`, ... by creating it.
    static Result ClaimName(const std::string& parent, const std::string& name, bool directory,
                            std::string& out_path);

    // Final path of `staged_path` after placement, or empty when it was
    // not moved out of staging.
    static std::string Relocate(const Destination& dest, const std::string& staged_path);

    // Moves `src` over `dst`, merging directories and replacing files.
    static Result MoveOver(const std::string& src, const std::string& dst);

  private:
    Result PlaceWrapped(const ArchiveSpec& spec, Destination& dest, ScopedTempDir& staging,
                        InteractionController& ui) const;
    Result PlaceEntry(const ArchiveSpec& spec, Destination& dest, const std::string& source,
                      const std::string& name, bool is_directory,
                      InteractionController& ui) const;
    Result MergeInto(const ArchiveSpec& spec, ScopedTempDir& staging, Destination& dest) const;
    Result ClaimOrAsk(const ArchiveSpec& spec, const std::string& parent, const std::string& name,
                      bool directory, InteractionController& ui, std::string& out_path,
                      bool& overwrite) const;

    PlacementOptions opt_;
};

} // namespace peel
