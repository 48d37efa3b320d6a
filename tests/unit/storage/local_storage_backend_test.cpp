#include <peek/storage/local_storage_backend.hpp>
#include <gtest/gtest.h>
#include "test_images.hpp"
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

namespace ps = peek::storage;
namespace pc = peek::core;
namespace pt = peek::test;

namespace {

std::vector<std::byte> bytes_of(const std::string& s) {
  std::vector<std::byte> out(s.size());
  std::memcpy(out.data(), s.data(), s.size());
  return out;
}

}  // namespace

TEST(LocalStorageBackend, SaveFetchRemove) {
  const auto root = pt::temp_dir("peek-local");
  ps::LocalStorageBackend storage(root);
  const auto payload = bytes_of("not really a png");

  auto key = storage.save(payload, "cat.png", "image/png");
  ASSERT_TRUE(key.has_value());
  EXPECT_TRUE(key->starts_with("images/"));
  EXPECT_TRUE(std::filesystem::is_regular_file(root / *key));

  auto fetched = storage.fetch(*key);
  ASSERT_TRUE(fetched.has_value());
  EXPECT_EQ(*fetched, payload);

  ASSERT_TRUE(storage.remove(*key).has_value());
  auto gone = storage.fetch(*key);
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error(), pc::ErrorCode::NotFound);
  EXPECT_TRUE(storage.remove(*key).has_value());  // absent key is fine
}

TEST(LocalStorageBackend, PutLeavesNoTemporaries) {
  const auto root = pt::temp_dir("peek-local");
  ps::LocalStorageBackend storage(root);
  ASSERT_TRUE(storage.put("images/a_annotated.png", bytes_of("x"), "image/png").has_value());
  ASSERT_TRUE(storage.put("images/a_annotated.png", bytes_of("yy"), "image/png").has_value());

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file()) ++files;
  }
  EXPECT_EQ(files, 1u);
  EXPECT_EQ(storage.fetch("images/a_annotated.png")->size(), 2u);
}

TEST(LocalStorageBackend, RejectsEscapingKeys) {
  ps::LocalStorageBackend storage(pt::temp_dir("peek-local"));
  auto r = storage.put("../outside.png", bytes_of("x"), "image/png");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), pc::ErrorCode::ValidationError);
  EXPECT_FALSE(storage.fetch("/etc/passwd").has_value());
}

TEST(LocalStorageBackend, Exists) {
  ps::LocalStorageBackend storage(pt::temp_dir("peek-local"));
  EXPECT_FALSE(*storage.exists("images/none.png"));
  ASSERT_TRUE(storage.put("images/some.png", bytes_of("x"), "image/png").has_value());
  EXPECT_TRUE(*storage.exists("images/some.png"));
}

TEST(LocalStorageBackend, PublicUrl) {
  ps::LocalStorageBackend no_base(pt::temp_dir("peek-local"));
  EXPECT_FALSE(no_base.public_url("images/a.png").has_value());

  ps::LocalStorageBackend with_base(pt::temp_dir("peek-local"), "https://cdn.example.com/");
  EXPECT_EQ(with_base.public_url("images/a.png"), "https://cdn.example.com/images/a.png");
}
