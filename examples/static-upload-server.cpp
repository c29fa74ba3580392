#include <trellis/trellis.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct UploadedFileView {
  std::string field;
  uint64_t size;
};

template <>
struct glz::meta<UploadedFileView> {
  using T = UploadedFileView;
  static constexpr auto value = glz::object("field", &T::field, "size", &T::size);
};

// Serves a directory and accepts multipart uploads, in thread-pool mode.
//   static-upload-server [port] [public root] [upload dir]
int main(int argc, char **argv) {
  uint16_t port = 3000;
  std::filesystem::path root = "./public";
  std::filesystem::path uploadDir = "./uploads";
  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }
  if (argc > 2) {
    root = argv[2];
  }
  if (argc > 3) {
    uploadDir = argv[3];
  }

  trellis::SignalHandler::Enable();

  struct Empty {};
  Empty ctx;
  trellis::App<Empty> app(ctx);

  try {
    std::filesystem::create_directories(root);
    const trellis::FileUploadHandler uploads(uploadDir, 5UL * 1024UL * 1024UL);

    app.use(trellis::AccessLog<Empty>());
    app.serveStatic(root);

    app.post("/upload", [&uploads](Empty &, trellis::HttpRequest &req, trellis::HttpResponse &resp) {
      const trellis::UploadResult result = uploads.process(req);
      std::map<std::string, std::vector<UploadedFileView>> body;
      auto &files = body["files"];
      for (const auto &file : result.files) {
        files.push_back({file.fieldName, file.size});
      }
      resp.status(trellis::http::StatusCodeCreated).sendJson(body);
    });

    app.setErrorHandler([](const std::exception &ex, trellis::HttpRequest &, trellis::HttpResponse &resp, Empty &) {
      const auto *multipartError = dynamic_cast<const trellis::MultipartError *>(&ex);
      if (multipartError == nullptr) {
        resp.status(trellis::http::StatusCodeInternalServerError).send("Internal Server Error");
      } else if (multipartError->kind() == trellis::MultipartError::Kind::PartTooLarge) {
        resp.status(trellis::http::StatusCodePayloadTooLarge).send(ex.what());
      } else {
        resp.status(trellis::http::StatusCodeBadRequest).send(ex.what());
      }
    });

    std::cout << "Serving " << root << " and storing uploads in " << uploadDir << '\n';
    app.listen(trellis::ServerConfig{}.withPort(port).withMode(trellis::ServerMode::ThreadPool).withMaxBodyBytes(
        64UL * 1024UL * 1024UL));
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
