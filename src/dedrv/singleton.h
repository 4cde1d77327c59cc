#pragma once

namespace dedrv {

// Process-wide instance of T, built on first use. Backs the global
// manager() so programs that never call it carry no manager object.
template <typename T, int N = 0> class Singleton {
  public:
    static T &instance() {
        static T instance;
        return instance;
    }
    Singleton(const Singleton &) = delete;
    Singleton &operator=(const Singleton &) = delete;

  private:
    Singleton() = default;
    ~Singleton() = default;
};

} // namespace dedrv
