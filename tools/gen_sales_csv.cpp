#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Synthetic sales CSV: "Department Name,Date,Number of Sales", dates in 2024, sales 10..500.

struct Args {
  std::uint64_t rows = 1'000'000;
  int departments = 100;
  std::string out = "output.csv";
  std::uint64_t seed = 0; // 0: time-based
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq == std::string::npos) ? "" : s.substr(eq + 1);
    if (key == "--rows") a.rows = std::stoull(val);
    else if (key == "--departments") a.departments = std::stoi(val);
    else if (key == "--out") a.out = val;
    else if (key == "--seed") a.seed = std::stoull(val);
    else if (key == "--help" || key == "-h") {
      std::cout << "Usage: gen-sales-csv [--rows=N] [--departments=N] [--out=path] [--seed=N]\n";
      std::exit(0);
    } else {
      std::cerr << "[gen] unknown argument: " << s << "\n";
      std::exit(2);
    }
  }
  if (a.departments <= 0) a.departments = 100;
  return a;
}

int main(int argc, char** argv) {
  Args a;
  try {
    a = parse_args(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[gen] bad argument: " << e.what() << "\n";
    return 2;
  }

  std::cout << "[gen] records=" << a.rows << " departments=" << a.departments
            << " output=" << a.out << "\n";

  std::ofstream out(a.out, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "[gen] cannot open " << a.out << "\n";
    return 1;
  }

  std::vector<std::string> depts;
  depts.reserve(static_cast<size_t>(a.departments));
  for (int i = 0; i < a.departments; ++i) depts.push_back("Department " + std::to_string(i + 1));

  std::mt19937_64 rng(a.seed ? a.seed : static_cast<std::uint64_t>(std::time(nullptr)));
  std::uniform_int_distribution<int> pick_dept(0, a.departments - 1);
  std::uniform_int_distribution<int> pick_day(0, 364);
  std::uniform_int_distribution<int> pick_sales(10, 500);

  static const int month_days[12] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

  out << "Department Name,Date,Number of Sales\n";
  char date[16];
  for (std::uint64_t i = 0; i < a.rows; ++i) {
    int day = pick_day(rng), month = 0;
    while (day >= month_days[month]) day -= month_days[month++];
    std::snprintf(date, sizeof(date), "2024-%02d-%02d", month + 1, day + 1);

    out << depts[static_cast<size_t>(pick_dept(rng))] << ',' << date << ',' << pick_sales(rng) << '\n';
    if (i > 0 && i % 1'000'000 == 0) std::cout << "[gen] written " << i << " rows...\n";
  }
  out.flush();
  if (!out) {
    std::cerr << "[gen] write failed: " << a.out << "\n";
    return 1;
  }
  std::cout << "[gen] done\n";
  return 0;
}
