
// Exercises the Python binding by embedding the interpreter.

#include <Python.h>

#include "check.h"

extern "C" PyObject *PyInit__i8080core(void);

static PyObject *module = nullptr;

static PyObject *get_attr(const char *name) {
    PyObject *attr = PyObject_GetAttrString(module, name);
    CHECK(attr != nullptr);
    return attr;
}

static PyObject *create(const char *type_name) {
    PyObject *type = get_attr(type_name);
    PyObject *object = PyObject_CallObject(type, nullptr);
    Py_DECREF(type);
    CHECK(object != nullptr);
    return object;
}

static long get_const(const char *name) {
    PyObject *attr = get_attr(name);
    long n = PyLong_AsLong(attr);
    Py_DECREF(attr);
    return n;
}

static long to_long(PyObject *object) {
    CHECK(object != nullptr);
    long n = PyLong_AsLong(object);
    Py_DECREF(object);
    return n;
}

// Checks that the last call failed with the given exception
// and clears it.
static bool failed_with(PyObject *res, PyObject *exception) {
    if(res) {
        Py_DECREF(res);
        return false;
    }
    bool matches = PyErr_ExceptionMatches(exception) != 0;
    PyErr_Clear();
    return matches;
}

// The module attribute is looked up with the pending exception
// put aside.
static bool failed_with(PyObject *res, const char *exception_name) {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyObject *exception = get_attr(exception_name);
    PyErr_Restore(type, value, traceback);

    bool matches = failed_with(res, exception);
    Py_DECREF(exception);
    return matches;
}

static long get_item(PyObject *object, long key) {
    PyObject *k = PyLong_FromLong(key);
    long n = to_long(PyObject_GetItem(object, k));
    Py_DECREF(k);
    return n;
}

static int set_item(PyObject *object, long key, long value) {
    PyObject *k = PyLong_FromLong(key);
    PyObject *v = PyLong_FromLong(value);
    int res = PyObject_SetItem(object, k, v);
    Py_DECREF(k);
    Py_DECREF(v);
    return res;
}

static PyObject *key_str() {
    static PyObject *key = PyUnicode_FromString("a");
    return key;
}

static void test_set_zero() {
    PyObject *f = create("_Flags");
    long zf = get_const("ZERO");

    PyObject *res = PyObject_CallMethod(f, "set_zero", "l", 0L);
    CHECK(res != nullptr);
    Py_DECREF(res);
    CHECK(get_item(f, zf) == 1);

    // Values wider than any machine integer are not zero.
    PyObject *one = PyLong_FromLong(1);
    PyObject *shift = PyLong_FromLong(70);
    PyObject *wide = PyNumber_Lshift(one, shift);
    Py_DECREF(one);
    Py_DECREF(shift);
    CHECK(wide != nullptr);
    res = PyObject_CallMethod(f, "set_zero", "O", wide);
    CHECK(res != nullptr);
    Py_DECREF(res);
    Py_DECREF(wide);
    CHECK(get_item(f, zf) == 0);

    res = PyObject_CallMethod(f, "set_zero", "d", 0.0);
    CHECK(res != nullptr);
    Py_DECREF(res);
    CHECK(get_item(f, zf) == 1);

    res = PyObject_CallMethod(f, "set_zero", "s", "x");
    CHECK(res != nullptr);
    Py_DECREF(res);
    CHECK(get_item(f, zf) == 0);

    Py_DECREF(f);
}

static void test_flags() {
    PyObject *f = create("_Flags");
    long cf = get_const("CARRY");
    long zf = get_const("ZERO");

    CHECK(PyObject_Length(f) == 5);
    CHECK(to_long(PyObject_CallMethod(f, "get_psw", nullptr)) == 0x02);

    PyObject *res = PyObject_CallMethod(f, "set", "l", cf);
    CHECK(res != nullptr);
    Py_DECREF(res);
    CHECK(get_item(f, cf) == 1);

    CHECK(set_item(f, zf, 1) == 0);
    CHECK(get_item(f, zf) == 1);
    CHECK(to_long(PyObject_CallMethod(f, "get_psw", nullptr)) == 0x43);

    CHECK(failed_with(PyObject_CallMethod(f, "set", "l", 1L),
                      "InvalidFlagError"));
    CHECK(failed_with(PyObject_CallMethod(f, "clear", "s", "carry"),
                      "InvalidFlagError"));

    PyObject *one = PyLong_FromLong(1);
    CHECK(failed_with(PyObject_GetItem(f, one), PyExc_IndexError));
    Py_DECREF(one);

    PyObject *key = PyUnicode_FromString("carry");
    CHECK(failed_with(PyObject_GetItem(f, key), PyExc_TypeError));
    Py_DECREF(key);

    CHECK(set_item(f, cf, 2) == -1);
    CHECK(PyErr_ExceptionMatches(PyExc_ValueError));
    PyErr_Clear();

    PyObject *one_value = PyLong_FromLong(1);
    CHECK(PyObject_SetItem(f, key_str(), one_value) == -1);
    CHECK(PyErr_ExceptionMatches(PyExc_TypeError));
    PyErr_Clear();
    Py_DECREF(one_value);

    // Iteration yields five values and may be repeated.
    for(unsigned pass = 0; pass != 2; ++pass) {
        PyObject *values = PySequence_Tuple(f);
        CHECK(values != nullptr);
        CHECK(PyTuple_Size(values) == 5);
        CHECK(PyLong_AsLong(PyTuple_GetItem(values, 0)) == 1);
        CHECK(PyLong_AsLong(PyTuple_GetItem(values, 1)) == 0);
        CHECK(PyLong_AsLong(PyTuple_GetItem(values, 3)) == 1);
        Py_DECREF(values);
    }

    Py_DECREF(f);
}

static void test_registers() {
    PyObject *r = create("_Registers");
    long h = get_const("H");
    long l = get_const("L");
    long c = get_const("C");
    long m = get_const("M");

    CHECK(get_item(r, get_const("A")) == 0);

    CHECK(set_item(r, h, 0x20) == 0);
    CHECK(set_item(r, l, 0x00) == 0);
    CHECK(to_long(PyObject_CallMethod(r, "get_address_from_pair", "l",
                                      h)) == 0x2000);
    CHECK(failed_with(PyObject_CallMethod(r, "get_address_from_pair", "l",
                                          c), "InvalidPairError"));
    CHECK(failed_with(PyObject_CallMethod(r, "get_address_from_pair", "l",
                                          8L), "InvalidPairError"));

    PyObject *res = PyObject_CallMethod(r, "set_value_for_pair", "(ll)k",
                                        h, l, 0x1234ul);
    CHECK(res != nullptr);
    Py_DECREF(res);
    CHECK(to_long(PyObject_CallMethod(r, "get_value_from_pair", "((ll))",
                                      h, l)) == 0x1234);
    CHECK(get_item(r, h) == 0x12);
    CHECK(get_item(r, l) == 0x34);

    CHECK(set_item(r, m, 1) == -1);
    CHECK(PyErr_ExceptionMatches(PyExc_IndexError));
    PyErr_Clear();

    // Register keys must be plain integers.
    CHECK(failed_with(PyObject_GetItem(r, key_str()), PyExc_TypeError));
    CHECK(failed_with(PyObject_GetItem(r, Py_True), PyExc_TypeError));
    PyObject *value = PyLong_FromLong(1);
    CHECK(PyObject_SetItem(r, key_str(), value) == -1);
    CHECK(PyErr_ExceptionMatches(PyExc_TypeError));
    PyErr_Clear();
    CHECK(PyObject_SetItem(r, Py_False, value) == -1);
    CHECK(PyErr_ExceptionMatches(PyExc_TypeError));
    PyErr_Clear();
    Py_DECREF(value);

    CHECK(to_long(PyObject_CallMethod(r, "get_register_from_opcode", "II",
                                      0176u, 3u)) == 7);

    PyObject *pair = PyObject_CallMethod(r, "get_pair_from_encoding", "l",
                                         2L);
    CHECK(pair != nullptr);
    CHECK(PyLong_AsLong(PyTuple_GetItem(pair, 0)) == h);
    CHECK(PyLong_AsLong(PyTuple_GetItem(pair, 1)) == l);
    Py_DECREF(pair);

    CHECK(failed_with(PyObject_CallMethod(r, "get_pair_from_encoding", "l",
                                          3L), "InvalidPairError"));

    Py_DECREF(r);
}

int main() {
    CHECK(PyImport_AppendInittab("_i8080core", PyInit__i8080core) != -1);
    Py_Initialize();

    module = PyImport_ImportModule("_i8080core");
    CHECK(module != nullptr);

    test_flags();
    test_set_zero();
    test_registers();

    Py_DECREF(module);
    CHECK(Py_FinalizeEx() == 0);
}
