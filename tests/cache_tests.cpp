#include <catch2/catch_all.hpp>
#include <gitauto/cache.hpp>

#include <filesystem>
#include <string>

using namespace gitauto;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

TEST_CASE("Compute runs once inside the window and again after it") {
  auto now = ResultCache::Clock::time_point{};
  ResultCache cache([&] { return now; });
  int computed = 0;
  auto compute = [&] { return ++computed; };

  REQUIRE(cache.get_or_compute<int>("k", 100ms, compute) == 1);
  now += 50ms;
  REQUIRE(cache.get_or_compute<int>("k", 100ms, compute) == 1);
  REQUIRE(computed == 1);

  now += 60ms; // 110ms after the store
  REQUIRE(cache.get_or_compute<int>("k", 100ms, compute) == 2);
  REQUIRE(computed == 2);
  REQUIRE(cache.size() == 1);
}

TEST_CASE("Entry exactly at the window edge is stale") {
  auto now = ResultCache::Clock::time_point{};
  ResultCache cache([&] { return now; });
  int computed = 0;
  cache.get_or_compute<int>("k", 100ms, [&] { return ++computed; });
  now += 100ms;
  cache.get_or_compute<int>("k", 100ms, [&] { return ++computed; });
  REQUIRE(computed == 2);
}

TEST_CASE("Keys are independent and clear drops everything") {
  ResultCache cache;
  int a = 0, b = 0;
  cache.get_or_compute<std::string>("a", 10s, [&] { ++a; return std::string("x"); });
  cache.get_or_compute<std::string>("b", 10s, [&] { ++b; return std::string("y"); });
  REQUIRE(cache.get_or_compute<std::string>("a", 10s, [&] {
            ++a;
            return std::string("z");
          }) == "x");
  REQUIRE(a == 1);
  REQUIRE(b == 1);
  REQUIRE(cache.size() == 2);

  cache.clear();
  REQUIRE(cache.size() == 0);
  cache.get_or_compute<std::string>("a", 10s, [&] { ++a; return std::string("x"); });
  REQUIRE(a == 2);
}

TEST_CASE("Cache key hashes the absolute directory") {
  auto d = fs::temp_directory_path();
  auto k1 = cache_key("analytics", d);
  REQUIRE(k1.rfind("analytics:", 0) == 0);
  REQUIRE(k1.size() > std::string("analytics:").size());
  REQUIRE(cache_key("analytics", d / "." ) == k1);
  REQUIRE(cache_key("suggestions", d) != k1);
  REQUIRE(cache_key("analytics", d / "other") != k1);
}
