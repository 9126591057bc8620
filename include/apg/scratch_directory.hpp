#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace apg {

// Uniquely named, exclusively owned directory for one extract-and-validate
// cycle. The tree is removed by Remove() or, failing that, the destructor.
class ScratchDirectory {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateUniqueDir(std::string_view base_dir,
                                       std::string_view prefix,
                                       std::string& out_dir) const = 0;
        virtual Result RemoveTree(std::string_view dir) const = 0;
    };

    ScratchDirectory();
    explicit ScratchDirectory(std::shared_ptr<const ISystemOps> system_ops);
    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
    ~ScratchDirectory();

    // Empty `base_dir` selects DefaultBaseDir().
    static Result Create(std::string_view base_dir, ScratchDirectory& out);

    // Removes the tree once. A failure is returned, not retried.
    Result Remove();

    const std::string& Path() const { return dir_; }
    bool Active() const { return !dir_.empty(); }

    // $TMPDIR when set, otherwise /tmp.
    static std::string DefaultBaseDir();
    // "apgcheck-<pid>-"; mkdtemp appends the random part.
    static std::string NamePrefix();

  private:
    void Cleanup();

    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
};

} // namespace apg
