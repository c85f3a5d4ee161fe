#include <stdlib.h>
#include <string.h>

// Allocates and touches argv[1] MiB. Exits with 2 if the allocation fails.
int main(int argc, char** argv) {
  if (argc < 2) return 1;
  const size_t size = atoi(argv[1]) * 1024 * 1024LL;
  char* data = static_cast<char*>(malloc(size));
  if (data == nullptr) return 2;
  memset(data, 1, size);
  int sum = 0;
  for (size_t i = 0; i < size; i += 4096) sum += data[i];
  free(data);
  return sum > 0 ? 0 : 3;
}
