#include <cstdio>

// Prints argv[1] on stdout and argv[2] on stderr.
int main(int argc, char** argv) {
  if (argc < 3) return 1;
  fputs(argv[1], stdout);  // NOLINT
  fputs(argv[2], stderr);  // NOLINT
  return 0;
}
