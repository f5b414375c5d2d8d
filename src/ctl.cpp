#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <sstream>

#include "mtrack/tracker_client.hpp"

using namespace mtrack;

static std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  // Empty items are kept; the server decides what to skip.
  while (std::getline(ss, item, ',')) out.push_back(item);
  return out;
}

static int usage() {
  std::cout << "Usage: ./mtrack_ctl [--addr HOST:PORT] <command>\n"
            << "  start ID[,ID...]       Start a session for the given users\n"
            << "  stop                   Stop the running session\n"
            << "  fetch ID [MIN [MAX]]   Print a user's samples as JSON\n";
  return 2;
}

static int report(const grpc::Status& st) {
  std::cerr << "Error (" << st.error_code() << "): " << st.error_message()
            << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::string addr = "localhost:8080";
  int i = 1;
  if (i + 1 < argc && std::string(argv[i]) == "--addr") {
    addr = argv[i + 1];
    i += 2;
  }
  if (i >= argc) return usage();

  std::string cmd = argv[i++];
  try {
    TrackerClient client(addr);

    if (cmd == "start" && i < argc) {
      rpc::StartReply reply;
      auto st = client.start(split_csv(argv[i]), &reply);
      if (!st.ok()) return report(st);
      std::cout << reply.message() << "\n";
      return 0;
    }

    if (cmd == "stop") {
      rpc::StopReply reply;
      auto st = client.stop(&reply);
      if (!st.ok()) return report(st);
      std::cout << reply.message() << "\n";
      return 0;
    }

    if (cmd == "fetch" && i < argc) {
      std::string user = argv[i++];
      std::optional<double> min, max;
      if (i < argc) min = std::stod(argv[i++]);
      if (i < argc) max = std::stod(argv[i++]);

      rpc::FetchReply reply;
      auto st = client.fetch(user, min, max, &reply);
      if (!st.ok()) return report(st);

      google::protobuf::util::JsonPrintOptions opts;
      opts.preserve_proto_field_names = true;
      opts.always_print_primitive_fields = true;
      std::string json;
      auto js = google::protobuf::util::MessageToJsonString(reply, &json, opts);
      if (!js.ok()) {
        std::cerr << "Error: encoding reply: " << js.ToString() << "\n";
        return 1;
      }
      std::cout << json << "\n";
      return 0;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }

  return usage();
}
