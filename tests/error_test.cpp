#include <offsync-cpp/error.hpp>
#include <offsync-cpp/remote_gateway.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace offsync_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::storage_io),          "storage_io");
    EXPECT_EQ(to_string_view(ErrorKind::storage_corrupt),     "storage_corrupt");
    EXPECT_EQ(to_string_view(ErrorKind::remote_network),      "remote_network");
    EXPECT_EQ(to_string_view(ErrorKind::remote_conflict),     "remote_conflict");
    EXPECT_EQ(to_string_view(ErrorKind::remote_unauthorized), "remote_unauthorized");
    EXPECT_EQ(to_string_view(ErrorKind::remote_server_fault), "remote_server_fault");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation),   "invalid_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::remote_network, "timed out"};
    const auto e2 = Error{ErrorKind::remote_network, "timed out"};
    const auto e3 = Error{ErrorKind::remote_server_fault, "timed out"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    EXPECT_NE((Error{ErrorKind::storage_io, "foo"}), (Error{ErrorKind::storage_io, "bar"}));
}

// -- StorageError -------------------------------------------------------------

TEST(StorageError, what_carries_kind_prefix) {
    const auto e = StorageError{StorageErrorKind::io, "disk full"};
    EXPECT_EQ(std::string{e.what()}, "io: disk full");
    EXPECT_EQ(e.kind(), StorageErrorKind::io);
    EXPECT_FALSE(e.is_fatal());
}

TEST(StorageError, corrupt_is_fatal) {
    const auto e = StorageError{StorageErrorKind::corrupt, "bad checksum"};
    EXPECT_TRUE(e.is_fatal());
    EXPECT_EQ(std::string{e.what()}, "corrupt: bad checksum");
}

TEST(StorageError, catchable_as_runtime_error) {
    EXPECT_THROW(throw StorageError(StorageErrorKind::io, "x"), std::runtime_error);
}

// -- RemoteErrorKind ----------------------------------------------------------

TEST(RemoteErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(RemoteErrorKind::network),      "network");
    EXPECT_EQ(to_string_view(RemoteErrorKind::conflict),     "conflict");
    EXPECT_EQ(to_string_view(RemoteErrorKind::unauthorized), "unauthorized");
    EXPECT_EQ(to_string_view(RemoteErrorKind::server_fault), "server_fault");
}

TEST(RemoteErrorKind, only_unauthorized_and_server_fault_count_toward_ceiling) {
    EXPECT_FALSE(counts_toward_ceiling(RemoteErrorKind::network));
    EXPECT_FALSE(counts_toward_ceiling(RemoteErrorKind::conflict));
    EXPECT_TRUE(counts_toward_ceiling(RemoteErrorKind::unauthorized));
    EXPECT_TRUE(counts_toward_ceiling(RemoteErrorKind::server_fault));
}

TEST(RemoteError, to_error_maps_kind_and_keeps_message) {
    const auto remote = RemoteError{RemoteErrorKind::unauthorized, "token expired", std::nullopt};
    EXPECT_EQ(remote.to_error(), (Error{ErrorKind::remote_unauthorized, "token expired"}));
}
