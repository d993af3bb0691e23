namespace evo {

/** \brief A bounded queue for exchanging individuals between concurrent
 * runs.
 *
 * All operations are non-blocking: trySend() fails if the channel is full,
 * tryReceive() fails if it is empty. A sequence of operations can be made
 * atomic with respect to other threads by holding a Lock, see
 * ChannelMigrator for an example. Functions taking a Lock argument require
 * that the lock is held on this channel.
 *
 * \tparam T the type of the items, usually an Individual. */
template<class T>
class MigrationChannel {
  std::deque<T> queue{};
  size_t cap;
  mutable std::mutex mtx{};

public:
  /** \brief Holds exclusive access to the channel. */
  using Lock = std::unique_lock<std::mutex>;

  /** \brief Creates an empty channel holding at most \b capacity items.
   *
   * \throws std::invalid_argument if \b capacity is zero. */
  explicit MigrationChannel(size_t capacity = 1): cap(capacity) {
    if(capacity == 0)
      throw std::invalid_argument("MigrationChannel(): Capacity must be positive.");
  }

  MigrationChannel(const MigrationChannel&) = delete;
  MigrationChannel& operator=(const MigrationChannel&) = delete;

  size_t capacity() const {
    return cap;
  }

  size_t size() const {
    Lock lock{mtx};
    return queue.size();
  }

  /** \brief Acquires exclusive access, blocking until available. */
  Lock lock() const {
    return Lock{mtx};
  }

  /** \brief Appends a copy of \b item if there is room. Returns \b true on
   * success. */
  bool trySend(const T& item) {
    Lock lock{mtx};
    return trySend(item, lock);
  }

  bool trySend(const T& item, Lock& lock) {
    check(lock);
    if(queue.size() >= cap)
      return false;
    queue.push_back(item);
    return true;
  }

  /** \brief Moves the oldest item into \b item if there is one. Returns
   * \b true on success, otherwise leaves \b item untouched. */
  bool tryReceive(T& item) {
    Lock lock{mtx};
    return tryReceive(item, lock);
  }

  bool tryReceive(T& item, Lock& lock) {
    check(lock);
    if(queue.empty())
      return false;
    item = std::move(queue.front());
    queue.pop_front();
    return true;
  }

private:
  void check(const Lock& lock) const {
    if(lock.mutex() != &mtx || !lock.owns_lock())
      throw std::logic_error("MigrationChannel: Lock not held on this channel.");
  }
}; // class MigrationChannel<T>

} // namespace evo
