int
main(int argc, char** argv)
{
	(void)argv;

	/* Compiles only if the compiler knows __builtin_expect. */
	if (__builtin_expect(argc > 1, 0))
		return 1;
	return 0;
}
