#include <cstdio>
#include <string>
#include <utility>
#include <upace/csv_io.hpp>
#include <upace/viewer/app.hpp>

using namespace upace;

int main(int argc, char** argv) {
  InputPaths paths;
  for (int i = 1; i + 1 < argc; i += 2) {
    const std::string a = argv[i];
    const char* v = argv[i + 1];
    if (a == "--track")          paths.track = v;
    else if (a == "--segments")  paths.segments = v;
    else if (a == "--activity")  paths.activity = v;
    else if (a == "--nutrition") paths.nutrition = v;
    else if (a == "--athletes")  paths.athletes = v;
    else if (a == "--athlete")   paths.athlete_key = v;
    else {
      std::fprintf(stderr, "unknown option: %s\n", a.c_str());
      return 2;
    }
  }

  std::string err;
  auto in = load_plan_inputs(paths, err);
  if (!in) {
    std::fprintf(stderr, "error: %s\n", err.c_str());
    std::fprintf(stderr, "usage: %s --track FILE --segments FILE [--activity FILE] "
                         "[--nutrition FILE] [--athletes FILE] [--athlete KEY]\n", argv[0]);
    return 1;
  }

  ViewerApp app(std::move(*in));
  return app.run();
}
