/*
	B2-uploader is a streaming uploader for B2-like object storages
	Copyright (C) 2013-2015 Yandex

	This program is free software; you can redistribute it and/or
	modify it under the terms of the GNU General Public License
	as published by the Free Software Foundation; either version 2
	of the License, or (at your option) any later version.

	This program is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with this program; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/


#include <gtest/gtest.h>

#include "local_storage.hpp"
#include "client.hpp"
#include "error.hpp"

#include "test_utils.hpp"

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace b2 {
namespace test {

namespace {

int
remove_entry(const char *path, const struct stat *, int, struct FTW *) {
	return std::remove(path);
}

std::string
read_file(const std::string &path) {
	std::ifstream input(path.c_str(), std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

bool
path_exists(const std::string &path) {
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

} // namespace

class local_storage_test : public ::testing::Test
{
protected:
	void
	SetUp() {
		char root_template[] = "/tmp/b2-uploader-test-XXXXXX";
		ASSERT_NE(nullptr, mkdtemp(root_template));

		config.root = root_template;
		config.account_id = "account";
		config.application_key = "key";
		config.buckets.push_back("bucket");

		storage = std::make_shared<local_storage_t>(test_logger(), config);
	}

	void
	TearDown() {
		if (!config.root.empty()) {
			EXPECT_EQ(0, nftw(config.root.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS));
		}
	}

	std::shared_ptr<bucket_api_t>
	get_bucket() {
		auto account = storage->authorize_account(cancellation, "account", "key");
		auto buckets = account->list_buckets(cancellation);

		EXPECT_EQ(1, buckets.size());
		return buckets.front();
	}

	local_storage_config_t config;
	std::shared_ptr<local_storage_t> storage;
	cancellation_t cancellation;
};

TEST_F(local_storage_test, wrong_key_is_rejected) {
	EXPECT_THROW(storage->authorize_account(cancellation, "account", "wrong"), authorization_error);
	EXPECT_THROW(storage->authorize_account(cancellation, "other", "key"), authorization_error);
}

TEST_F(local_storage_test, account_lists_configured_buckets) {
	config.buckets.push_back("archive");
	storage = std::make_shared<local_storage_t>(test_logger(), config);

	auto account = storage->authorize_account(cancellation, "account", "key");
	ASSERT_TRUE(static_cast<bool>(account));

	auto buckets = account->list_buckets(cancellation);

	ASSERT_EQ(2, buckets.size());
	EXPECT_EQ("bucket", buckets[0]->get_name());
	EXPECT_EQ("archive", buckets[1]->get_name());
}

TEST_F(local_storage_test, file_is_stored) {
	auto bucket = get_bucket();
	auto data = make_pattern(0, 1000);

	auto upload_url = bucket->get_upload_url(cancellation);
	auto result = upload_url->upload_file(cancellation, data.data(), data.size()
			, "dir/file", "text/plain", sha1_hex(data.data(), data.size()), file_info_t());

	EXPECT_EQ("dir/file", result.name);
	EXPECT_EQ(1000, result.size);
	EXPECT_EQ(data, read_file(config.root + "/bucket/dir%2Ffile"));
}

TEST_F(local_storage_test, corrupted_file_is_rejected) {
	auto bucket = get_bucket();
	auto data = make_pattern(0, 100);

	auto upload_url = bucket->get_upload_url(cancellation);

	try {
		upload_url->upload_file(cancellation, data.data(), data.size()
				, "file", "text/plain", sha1_hex("abc", 3), file_info_t());
		ADD_FAILURE() << "upload must fail";
	} catch (const remote_error &ex) {
		EXPECT_EQ(400, ex.status());
	}

	EXPECT_FALSE(path_exists(config.root + "/bucket/file"));
}

TEST_F(local_storage_test, large_file_requires_all_parts) {
	auto bucket = get_bucket();
	auto large_file = bucket->start_large_file(cancellation, "file", "text/plain", file_info_t());
	auto upload_part_url = large_file->get_upload_part_url(cancellation);

	auto data = make_pattern(0, 10);
	upload_part_url->upload_part(cancellation, data.data(), sha1_hex(data.data(), data.size())
			, data.size(), 2);

	try {
		large_file->finish_large_file(cancellation);
		ADD_FAILURE() << "finish must fail";
	} catch (const remote_error &ex) {
		EXPECT_EQ(400, ex.status());
	}

	upload_part_url->upload_part(cancellation, data.data(), sha1_hex(data.data(), data.size())
			, data.size(), 1);

	auto result = large_file->finish_large_file(cancellation);

	EXPECT_EQ(20, result.size);
	EXPECT_EQ(data + data, read_file(config.root + "/bucket/file"));
	EXPECT_THROW(large_file->finish_large_file(cancellation), remote_error);
}

TEST_F(local_storage_test, writer_stores_large_file) {
	auto client = client_t::authorize(test_logger(), storage, cancellation, "account", "key");
	auto bucket = client->bucket(cancellation, "bucket");

	writer_options_t options;
	options.part_size = 100;
	options.concurrent_uploads = 3;

	auto writer = bucket->new_writer(cancellation, "video.mp4", "video/mp4"
			, file_info_t(), options);

	write_pattern(*writer, 1050, 33);
	writer->close();

	EXPECT_EQ(1050, writer->get_result().size);
	EXPECT_EQ(pattern_sha1(0, 1050), writer->get_result().sha1);
	EXPECT_EQ(make_pattern(0, 1050), read_file(config.root + "/bucket/video.mp4"));
	EXPECT_EQ(11, writer->get_info().parts_sealed);
}

TEST_F(local_storage_test, writer_stores_small_file) {
	auto client = client_t::authorize(test_logger(), storage, cancellation, "account", "key");
	auto bucket = client->bucket(cancellation, "bucket");

	auto writer = bucket->new_writer(cancellation, "note.txt", "text/plain");

	write_pattern(*writer, 500, 64);
	writer->close();

	EXPECT_EQ(pattern_sha1(0, 500), writer->get_result().sha1);
	EXPECT_EQ(make_pattern(0, 500), read_file(config.root + "/bucket/note.txt"));
}

TEST_F(local_storage_test, dot_names_stay_inside_bucket) {
	auto bucket = get_bucket();
	auto data = make_pattern(0, 10);
	auto sha1 = sha1_hex(data.data(), data.size());

	auto upload_url = bucket->get_upload_url(cancellation);
	upload_url->upload_file(cancellation, data.data(), data.size()
			, "..", "text/plain", sha1, file_info_t());
	upload_url->upload_file(cancellation, data.data(), data.size()
			, ".", "text/plain", sha1, file_info_t());

	EXPECT_EQ(data, read_file(config.root + "/bucket/%2E%2E"));
	EXPECT_EQ(data, read_file(config.root + "/bucket/%2E"));
}

TEST_F(local_storage_test, empty_name_is_rejected) {
	auto bucket = get_bucket();
	auto data = make_pattern(0, 10);

	auto upload_url = bucket->get_upload_url(cancellation);

	try {
		upload_url->upload_file(cancellation, data.data(), data.size()
				, "", "text/plain", sha1_hex(data.data(), data.size()), file_info_t());
		ADD_FAILURE() << "upload must fail";
	} catch (const remote_error &ex) {
		EXPECT_EQ(400, ex.status());
	}

	EXPECT_THROW(bucket->start_large_file(cancellation, "", "text/plain", file_info_t())
			, remote_error);
}

TEST(escape_file_name, dot_names) {
	EXPECT_EQ("%2E", escape_file_name("."));
	EXPECT_EQ("%2E%2E", escape_file_name(".."));
	EXPECT_EQ("...", escape_file_name("..."));
	EXPECT_EQ(".hidden", escape_file_name(".hidden"));
	EXPECT_THROW(escape_file_name(""), remote_error);
}

TEST(escape_file_name, slashes_and_percents) {
	EXPECT_EQ("plain.txt", escape_file_name("plain.txt"));
	EXPECT_EQ("a%2Fb%2Fc", escape_file_name("a/b/c"));
	EXPECT_EQ("100%25%2Fdone", escape_file_name("100%/done"));
}

} // namespace test
} // namespace b2
