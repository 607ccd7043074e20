#ifndef lf_leader_cache_hpp
#define lf_leader_cache_hpp

#include <chrono>
#include <shared_mutex>
#include <string>

namespace lf {

/// The address of the leader's primary endpoint.
struct leader_address {
  std::string host;
  int port = 0;

  /// True if no leader is known.
  bool empty() const {
    return host.empty();
  }

  /// Format the address as http://host:port.
  std::string url() const;
};

inline bool operator==(leader_address const& lhs, leader_address const& rhs) {
  return lhs.host == rhs.host and lhs.port == rhs.port;
}

inline bool operator!=(leader_address const& lhs, leader_address const& rhs) {
  return not(lhs == rhs);
}

/// A consistent copy of the cache contents.
struct leader_snapshot {
  leader_address address;
  /// When the address was last published, meaningless if the address is empty.
  std::chrono::steady_clock::time_point published;
};

/**
 * The leader address shared between the refresh loop and the queries.
 *
 * One writer (the refresh loop) and any number of readers.  Readers never block each other, a write excludes all
 * readers while both fields are replaced, so a reader sees either the previous or the next address, never a mix.
 * Once set, the address is never cleared.
 */
class leader_cache {
public:
  leader_cache()
      : mu_()
      , current_() {
  }

  leader_cache(leader_cache const&) = delete;
  leader_cache& operator=(leader_cache const&) = delete;

  /// Return a copy of the current contents, with an empty address if nothing was published yet.
  leader_snapshot read() const;

  /**
   * Replace the current address.
   *
   * @throws lf::internal_error if @a address is empty.
   */
  void write(leader_address address, std::chrono::steady_clock::time_point published);

  /// Replace the current address, stamped with the current time.
  void write(leader_address address) {
    write(std::move(address), std::chrono::steady_clock::now());
  }

private:
  mutable std::shared_timed_mutex mu_;
  leader_snapshot current_;
};

} // namespace lf

#endif // lf_leader_cache_hpp
