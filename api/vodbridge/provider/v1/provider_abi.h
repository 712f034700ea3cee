#pragma once

/*
  C ABI exposed by in-process provider modules.

  A provider module is a shared object exporting one symbol:

      const vb_provider_class* vb_provider_find_class(const char* name);

  which returns the class table for `name`, or NULL when the module does not
  define that class.

  Arguments and results cross the boundary as UTF-8 JSON:
    - positional calls receive a JSON array
    - keyword calls receive a JSON object
    - results are any JSON value

  invoke() returns one of the VB_INVOKE_* codes. On VB_INVOKE_OK *result_json
  holds the result; on VB_INVOKE_ERROR it holds a message (or NULL). Strings
  returned through result_json are released with the class's free_string().
*/

#ifdef __cplusplus
extern "C" {
#endif

#define VB_PROVIDER_ABI_VERSION 1

enum {
  VB_INVOKE_OK                 = 0,
  VB_INVOKE_SIGNATURE_MISMATCH = 1,
  VB_INVOKE_ERROR              = 2,
};

typedef struct vb_provider_class {
  int abi_version;

  const char* name;

  void* (*create)(void);
  void (*destroy)(void* self);

  /* NULL-terminated list of method names */
  const char* const* methods;

  int (*invoke)(void* self, const char* method, const char* args_json, int keyword_args, char** result_json);

  void (*free_string)(char* str);
} vb_provider_class;

typedef const vb_provider_class* (*vb_provider_find_class_fn)(const char* name);

#define VB_PROVIDER_FIND_CLASS_SYMBOL "vb_provider_find_class"

#ifdef __cplusplus
}
#endif
