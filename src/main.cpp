// Copyright (c) 2026 skern authors

#include <format>
#include <iostream>

#include "glog/logging.h"
#include "skern/cli.hpp"

int main(int argc, char** argv) {
  /* clang-format off */
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);
  google::InstallPrefixFormatter(
      +[](std::ostream& ostrm, const google::LogMessage& m, void*) -> void {
        ostrm << std::format(
            "datetime={:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d} "
            "level={} "
            "threadid={} "
            "loc={}:{}",

            m.time().year(), m.time().month(), m.time().day(), m.time().hour(),
            m.time().min(), m.time().sec(), m.time().usec(),

            google::GetLogSeverityName(m.severity())[0],

            m.thread_id(),

            m.basename(), m.line());
      });
  /* clang-format on */

  std::ios_base::sync_with_stdio(false);
  auto status = skern::RunCli(argc, argv, std::cout, std::cerr);

  google::ShutdownGoogleLogging();
  return status;
}
