#pragma once

namespace apg {

// Owning POSIX file descriptor. Never closes stdin.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();

    // Returns 0 or the errno reported by close(2).
    int Close();

  private:
    int fd_{-1};
};

} // namespace apg
