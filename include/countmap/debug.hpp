#pragma once

#ifdef USE_CPPTRACE

#include <array>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <iostream>

#include <cpptrace/cpptrace.hpp>
#include <cpptrace/formatting.hpp>

enum class DebugState { Undef, Constructed, MovedFrom, Destructed };

struct DebugItem {
  DebugState state = DebugState::Undef;
  cpptrace::stacktrace construct_trace = {};
  cpptrace::stacktrace move_from_trace = {};
  cpptrace::stacktrace destruct_trace = {};

  void constructor() {
    switch (state) {
      case DebugState::Undef:
      case DebugState::Destructed:
        *this = {};
        construct_trace = generate_trace();
        state = DebugState::Constructed;
        break;
      default:
        fail("Double construct");
    }
  }

  void destructor() {
    switch (state) {
      case DebugState::Undef:
        fail("Early destruct");
        break;
      case DebugState::Destructed:
        fail("Double destruct");
        break;
      default:
        destruct_trace = generate_trace();
        state = DebugState::Destructed;
        break;
    }
  }

  void moved_from() {
    switch (state) {
      case DebugState::Undef:
        fail("Early move");
        break;
      case DebugState::Destructed:
        fail("Move from destructed");
        break;
      default:
        move_from_trace = generate_trace();
        state = DebugState::MovedFrom;
        break;
    }
  }

  void assigned_to() {
    if (state == DebugState::Undef) {
      fail("Early assign");
    }
    state = DebugState::Constructed;
  }

  void copied_from() const {
    switch (state) {
      case DebugState::MovedFrom:
        fail("Copy from moved");
        break;
      case DebugState::Destructed:
        fail("Copy from destructed");
        break;
      default:
        break;
    }
  }

  void use() const {
    if (state != DebugState::Constructed) {
      fail("Using not constructed");
    }
  }

  static void print_current_trace() {
    cpptrace::formatter formatter = cpptrace::get_default_formatter();
    formatter.paths(cpptrace::formatter::path_mode::basename);
    print(generate_trace(), formatter);
  }

 private:
  [[noreturn]] void fail(const char* msg) const {
    cpptrace::formatter formatter = cpptrace::get_default_formatter();
    formatter.paths(cpptrace::formatter::path_mode::basename);
    std::cout << "\n\nCountMapDebug: " << msg << "\n";
    print(generate_trace(), formatter);
    std::cout << "\nConstructed at trace:\n";
    print(construct_trace, formatter);
    std::cout << "\nMoved from trace:\n";
    print(move_from_trace, formatter);
    std::cout << "\nDestructed trace:\n";
    print(destruct_trace, formatter);
    throw std::runtime_error(msg);
  }

  static void print(const cpptrace::stacktrace& trace,
                    const cpptrace::formatter& formatter) {
    size_t frame_no = 0;
    for (auto& i : trace.frames) {
      if ((i.filename.find("include/countmap") != std::string::npos or
           i.filename.find("test/test_") != std::string::npos) and
          i.symbol.find("Debug::") != 0 and i.symbol.find("DebugItem::") != 0) {
        std::cout << "#" << frame_no << "  ";
        formatter.print(std::cout, i);
        std::cout << "\n" << cpptrace::get_snippet(i.filename, i.line.value(), 5, true);
        std::cout << "\n\n";
      }
      ++frame_no;
    }
  }

  static cpptrace::stacktrace generate_trace() {
    return cpptrace::generate_trace(0, 200);
  }
};

struct DebugBucket {
  mutable std::recursive_mutex mutex;
  std::unordered_map<const void*, DebugItem> items;
};

static inline DebugBucket& GetDebugBucket(const void* ptr) {
  static std::array<DebugBucket, 32> buckets_{};
  return buckets_.at(std::hash<const void*>()(ptr) % buckets_.size());
}

// Tracks the lifetime of the owning object so that use of a moved-from or destroyed
// container is reported with the traces of the offending transitions.
struct Debug {
  Debug() {
    DebugBucket& bucket = GetDebugBucket(this);
    std::unique_lock lock{bucket.mutex};
    bucket.items[this].constructor();
  }

  ~Debug() {
    DebugBucket& bucket = GetDebugBucket(this);
    std::unique_lock lock{bucket.mutex};
    bucket.items[this].destructor();
  }

  Debug(Debug&& other) : Debug() {
    DebugBucket& bucket_other = GetDebugBucket(&other);
    std::unique_lock lock{bucket_other.mutex};
    bucket_other.items[&other].moved_from();
  }

  Debug(const Debug& other) : Debug() {
    DebugBucket& bucket_other = GetDebugBucket(&other);
    std::unique_lock lock{bucket_other.mutex};
    bucket_other.items[&other].copied_from();
  }

  Debug& operator=(Debug&& other) {
    DebugBucket& bucket = GetDebugBucket(this);
    DebugBucket& bucket_other = GetDebugBucket(&other);
    std::scoped_lock lock{bucket.mutex, bucket_other.mutex};
    bucket_other.items[&other].moved_from();
    bucket.items[this].assigned_to();
    return *this;
  }

  Debug& operator=(const Debug& other) {
    DebugBucket& bucket = GetDebugBucket(this);
    DebugBucket& bucket_other = GetDebugBucket(&other);
    std::scoped_lock lock{bucket.mutex, bucket_other.mutex};
    bucket_other.items[&other].copied_from();
    bucket.items[this].assigned_to();
    return *this;
  }

  void use() const {
    const DebugBucket& bucket = GetDebugBucket(this);
    std::unique_lock lock{bucket.mutex};
    auto it = bucket.items.find(this);
    if (it == bucket.items.end()) {
      throw std::runtime_error("Item not found");
    }
    it->second.use();
  }
};

#define COUNTMAP_DEBUG_THIS Debug debug_
#define COUNTMAP_DEBUG_USE debug_.use()

#else

#define COUNTMAP_DEBUG_THIS static_assert(true)
#define COUNTMAP_DEBUG_USE

#endif
