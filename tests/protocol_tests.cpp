#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

using namespace replisync::test;

namespace {

// Messages cross the wire as one line of text.
json over_the_wire(const json& message) {
  return json::parse(message.dump());
}

bool test_requests(TestContext& ctx) {
  BlockRequest request;
  request.id = 42;
  request.folder = "default";
  request.name = "dir/file";
  request.offset = int64_t{5} << 32;
  request.size = 131072;
  request.hash = sha256_bytes("hello");
  request.weak_hash = 103547413u;
  request.from_temporary = true;

  std::string error;
  auto parsed = parse_request(over_the_wire(make_request(request)), error);
  if(!expect(ctx, parsed.has_value(), "the request parsed: " + error)) return false;
  bool ok = expect(ctx, parsed->id == 42 && parsed->folder == "default" && parsed->name == "dir/file",
                   "id, folder and name kept");
  ok &= expect(ctx, parsed->offset == request.offset && parsed->size == 131072, "offsets past 4 GiB kept");
  ok &= expect(ctx, parsed->hash == request.hash && parsed->weak_hash == 103547413u, "both hashes kept");
  ok &= expect(ctx, parsed->from_temporary, "from_temporary kept");

  BlockRequest unhashed;
  unhashed.id = 7;
  auto plain = parse_request(over_the_wire(make_request(unhashed)), error);
  ok &= expect(ctx, plain && plain->hash.empty() && plain->weak_hash == 0, "a request without hashes");

  auto bad_hash = make_request(request);
  bad_hash["hash"] = "not hex";
  error.clear();
  ok &= expect(ctx, !parse_request(bad_hash, error) && !error.empty(), "a malformed hash refused");

  auto no_id = make_request(request);
  no_id.erase("id");
  error.clear();
  ok &= expect(ctx, !parse_request(no_id, error) && error.find("malformed request") != std::string::npos,
               "a request without id refused");
  return ok;
}

bool test_responses(TestContext& ctx) {
  RequestResponse data;
  data.data = {'\0', '\xff', 'a', '\x80'};
  std::string error;
  auto parsed = parse_response(over_the_wire(make_response(3, data)), error);
  bool ok = expect(ctx, parsed && parsed->ok() && parsed->data == data.data, "binary data kept: " + error);

  auto failure = RequestResponse::failure(RequestError::PermissionDenied, "symlink in path");
  auto refused = parse_response(over_the_wire(make_response(4, failure)), error);
  ok &= expect(ctx, refused && refused->error == RequestError::PermissionDenied &&
                    refused->message == "symlink in path",
               "the error code and message kept");

  json unknown = {{"type", "response"}, {"id", 5}, {"code", "exploded"}};
  auto generic = parse_response(unknown, error);
  ok &= expect(ctx, generic && generic->error == RequestError::Generic, "unknown codes read as generic");

  json none = {{"type", "response"}, {"id", 6}, {"code", "none"}};
  auto not_ok = parse_response(none, error);
  ok &= expect(ctx, not_ok && !not_ok->ok(), "an error response never reads as success");

  json bad = {{"type", "response"}, {"id", 7}, {"data", "abc"}};
  error.clear();
  ok &= expect(ctx, !parse_response(bad, error) && error == "bad base64 payload", "bad base64 refused");

  ok &= expect(ctx, to_string(RequestError::InvalidContent) == std::string("invalid_content") &&
                    request_error_from_string("invalid_content") == RequestError::InvalidContent,
               "error names");
  return ok;
}

bool test_index_messages(TestContext& ctx) {
  FileInfo file;
  file.name = "a";
  file.size = 5;
  file.version = file.version.updated("dev-a");
  file.sequence = 1;
  BlockInfo block;
  block.size = 5;
  block.hash = sha256_bytes("hello");
  block.weak_hash = weak_hash("hello", 5);
  file.blocks.push_back(block);

  auto message = over_the_wire(make_index_update("default", {file}));
  bool ok = expect(ctx, message.value("type", "") == "index_update" && message.value("folder", "") == "default",
                   "type and folder set");
  std::string error;
  auto files = parse_files(message, error);
  ok &= expect(ctx, files && files->size() == 1 && (*files)[0].name == "a" &&
                    (*files)[0].blocks.size() == 1 && (*files)[0].blocks[0].hash == block.hash,
               "the file list parsed: " + error);

  json empty = {{"type", "index"}, {"folder", "default"}};
  error.clear();
  ok &= expect(ctx, !parse_files(empty, error) && error == "index without file list", "a missing file list refused");

  auto hello = make_hello("dev-a");
  ok &= expect(ctx, hello.value("device_id", "") == "dev-a" && hello.value("client", "") == kClientName,
               "hello carries the device id");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"requests", test_requests},
    {"responses", test_responses},
    {"index_messages", test_index_messages},
  };
  return run_test_cases(argc, argv, "protocol", tests);
}
