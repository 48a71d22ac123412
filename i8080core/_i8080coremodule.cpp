
/*  Intel 8080 CPU State Module for Python.

    Copyright (c) 2017 Ivan Kosarev <mail@ivankosarev.com>
    Published under the MIT license.
*/

#include <Python.h>

#include <new>

#include "../i8080core.h"

namespace {

using i8080core::fast_u8;
using i8080core::fast_u16;

using i8080core::reg;
using i8080core::register_file;
using i8080core::register_pair;
using i8080core::state_error;

PyObject *invalid_flag_error = nullptr;
PyObject *invalid_pair_error = nullptr;

PyObject *get_exception(state_error e) {
    switch(e) {
    case state_error::none:
        break;
    case state_error::invalid_flag:
        return invalid_flag_error;
    case state_error::out_of_range_flag:
    case state_error::invalid_register:
        return PyExc_IndexError;
    case state_error::invalid_pair:
        return invalid_pair_error;
    case state_error::type_mismatch:
        return PyExc_TypeError;
    case state_error::invalid_value:
        return PyExc_ValueError;
    }
    i8080core::unreachable("No exception for this error kind.");
}

PyObject *raise_error(state_error e) {
    PyErr_SetString(get_exception(e), i8080core::get_error_name(e));
    return nullptr;
}

// Only genuine integers are accepted as keys, not even booleans.
// Negative and huge keys are reported as out of range.
bool get_key(PyObject *key, state_error out_of_range, unsigned &n) {
    if(!PyLong_CheckExact(key)) {
        raise_error(state_error::type_mismatch);
        return false;
    }

    int overflow = 0;
    long v = PyLong_AsLongAndOverflow(key, &overflow);
    if(v == -1 && PyErr_Occurred())
        return false;
    if(overflow || v < 0 || v > 0xff) {
        raise_error(out_of_range);
        return false;
    }

    n = static_cast<unsigned>(v);
    return true;
}

// Type errors on values are not about keys, so they get a message
// of their own.
PyObject *raise_value_error(state_error invalid) {
    if(invalid != state_error::type_mismatch)
        return raise_error(invalid);
    PyErr_SetString(PyExc_TypeError, "expected an integer value");
    return nullptr;
}

bool get_int(PyObject *value, state_error invalid, long &n) {
    if(!PyLong_Check(value)) {
        raise_value_error(invalid);
        return false;
    }

    int overflow = 0;
    n = PyLong_AsLongAndOverflow(value, &overflow);
    if(n == -1 && PyErr_Occurred())
        return false;
    if(overflow) {
        raise_value_error(invalid);
        return false;
    }
    return true;
}

PyObject *build_pair(register_pair rp) {
    return Py_BuildValue("(ii)", static_cast<int>(rp.get_hi()),
                         static_cast<int>(rp.get_lo()));
}

bool parse_pair(PyObject *pair, register_pair &rp) {
    if(!PyTuple_Check(pair)) {
        raise_error(state_error::type_mismatch);
        return false;
    }

    int hi, lo;
    if(!PyArg_ParseTuple(pair, "ii", &hi, &lo))
        return false;
    if(hi < 0 || hi > 7 || lo < 0 || lo > 7) {
        raise_error(state_error::invalid_register);
        return false;
    }
    rp = register_pair(static_cast<reg>(hi), static_cast<reg>(lo));
    return true;
}

struct flags_object {
    PyObject_HEAD
    i8080core::i8080_flags flags;
};

i8080core::i8080_flags &get_flags(PyObject *self) {
    return reinterpret_cast<flags_object*>(self)->flags;
}

PyObject *flags_new(PyTypeObject *type, PyObject *args, PyObject *kwds) {
    i8080core::unused(args, kwds);
    PyObject *self = type->tp_alloc(type, 0);
    if(!self)
        return nullptr;

    new(&get_flags(self)) i8080core::i8080_flags();
    return self;
}

void flags_dealloc(PyObject *self) {
    get_flags(self).~i8080_flags();
    Py_TYPE(self)->tp_free(self);
}

// The named entry points report any unaddressable flag, whatever
// its type, as an invalid flag.
bool get_named_flag(PyObject *arg, i8080core::flag &f) {
    if(!PyLong_CheckExact(arg)) {
        raise_error(state_error::invalid_flag);
        return false;
    }

    int overflow = 0;
    long v = PyLong_AsLongAndOverflow(arg, &overflow);
    if(v == -1 && PyErr_Occurred())
        return false;
    if(overflow || v < 0 || v > 0xff) {
        raise_error(state_error::invalid_flag);
        return false;
    }

    f = static_cast<i8080core::flag>(v);
    return true;
}

PyObject *flags_set(PyObject *self, PyObject *arg) {
    i8080core::flag f;
    if(!get_named_flag(arg, f))
        return nullptr;
    state_error e = get_flags(self).set(f);
    if(e != state_error::none)
        return raise_error(e);
    Py_RETURN_NONE;
}

PyObject *flags_clear(PyObject *self, PyObject *arg) {
    i8080core::flag f;
    if(!get_named_flag(arg, f))
        return nullptr;
    state_error e = get_flags(self).clear(f);
    if(e != state_error::none)
        return raise_error(e);
    Py_RETURN_NONE;
}

PyObject *flags_clear_all(PyObject *self, PyObject *args) {
    i8080core::unused(args);
    get_flags(self).clear_all();
    Py_RETURN_NONE;
}

PyObject *flags_reset(PyObject *self, PyObject *args) {
    i8080core::unused(args);
    get_flags(self).reset();
    Py_RETURN_NONE;
}

PyObject *flags_calculate_parity(PyObject *self, PyObject *arg) {
    long n;
    if(!get_int(arg, state_error::type_mismatch, n))
        return nullptr;
    get_flags(self).calculate_parity(i8080core::mask8(n));
    Py_RETURN_NONE;
}

// Takes any value that compares to zero, whatever its type or
// width.
PyObject *flags_set_zero(PyObject *self, PyObject *arg) {
    PyObject *zero = PyLong_FromLong(0);
    if(!zero)
        return nullptr;
    int is_zero = PyObject_RichCompareBool(arg, zero, Py_EQ);
    Py_DECREF(zero);
    if(is_zero < 0)
        return nullptr;
    get_flags(self).set_zero(is_zero ? 0 : 1);
    Py_RETURN_NONE;
}

PyObject *flags_set_sign(PyObject *self, PyObject *arg) {
    long n;
    if(!get_int(arg, state_error::type_mismatch, n))
        return nullptr;
    get_flags(self).set_sign(i8080core::mask8(n));
    Py_RETURN_NONE;
}

PyObject *flags_get_psw(PyObject *self, PyObject *args) {
    i8080core::unused(args);
    return PyLong_FromUnsignedLong(get_flags(self).get_psw());
}

PyObject *flags_set_psw(PyObject *self, PyObject *arg) {
    long n;
    if(!get_int(arg, state_error::type_mismatch, n))
        return nullptr;
    get_flags(self).set_psw(i8080core::mask8(n));
    Py_RETURN_NONE;
}

Py_ssize_t flags_length(PyObject *self) {
    return static_cast<Py_ssize_t>(get_flags(self).size());
}

PyObject *flags_subscript(PyObject *self, PyObject *key) {
    unsigned bit;
    if(!get_key(key, state_error::out_of_range_flag, bit))
        return nullptr;
    i8080core::result<fast_u8> r = get_flags(self).get(bit);
    if(!r)
        return raise_error(r.get_error());
    return PyLong_FromUnsignedLong(r.get());
}

int flags_ass_subscript(PyObject *self, PyObject *key, PyObject *value) {
    if(!value) {
        PyErr_SetString(PyExc_TypeError, "flags cannot be deleted");
        return -1;
    }

    unsigned bit;
    if(!get_key(key, state_error::out_of_range_flag, bit))
        return -1;

    // Check the bit first so that an unaddressable bit is reported
    // as such regardless of the value.
    if(!get_flags(self).get(bit)) {
        raise_error(state_error::out_of_range_flag);
        return -1;
    }

    long n;
    if(!get_int(value, state_error::invalid_value, n))
        return -1;
    if(n != 0 && n != 1) {
        raise_error(state_error::invalid_value);
        return -1;
    }

    state_error e = get_flags(self).set_value(bit, static_cast<fast_u8>(n));
    if(e != state_error::none) {
        raise_error(e);
        return -1;
    }
    return 0;
}

PyObject *flags_iter(PyObject *self) {
    i8080core::flag_values values = get_flags(self).get_values();
    PyObject *list = PyTuple_New(values.size());
    if(!list)
        return nullptr;

    for(unsigned i = 0; i != values.size(); ++i) {
        PyObject *v = PyLong_FromUnsignedLong(values[i]);
        if(!v) {
            Py_DECREF(list);
            return nullptr;
        }
        PyTuple_SET_ITEM(list, i, v);
    }

    PyObject *iter = PyObject_GetIter(list);
    Py_DECREF(list);
    return iter;
}

PyMethodDef flags_methods[] = {
    {"set", flags_set, METH_O,
     "Set the given condition flag."},
    {"clear", flags_clear, METH_O,
     "Clear the given condition flag."},
    {"clear_all", flags_clear_all, METH_NOARGS,
     "Clear all condition flags."},
    {"calculate_parity", flags_calculate_parity, METH_O,
     "Set the parity flag if the byte has an even number of raised bits."},
    {"set_zero", flags_set_zero, METH_O,
     "Set the zero flag if the value is zero, clear it otherwise."},
    {"set_sign", flags_set_sign, METH_O,
     "Set the sign flag if the byte is negative, clear it otherwise."},
    {"get_psw", flags_get_psw, METH_NOARGS,
     "Return the whole flag byte."},
    {"set_psw", flags_set_psw, METH_O,
     "Set the whole flag byte. Reserved bits keep their values."},
    {"reset", flags_reset, METH_NOARGS,
     "Restore the power-on state."},
    { nullptr, nullptr, 0, nullptr }  // Sentinel.
};

PyMappingMethods flags_as_mapping = {
    flags_length,               // mp_length
    flags_subscript,            // mp_subscript
    flags_ass_subscript,        // mp_ass_subscript
};

PyTypeObject flags_type_object = {
    PyVarObject_HEAD_INIT(&PyType_Type, 0)
    "i8080core._i8080core._Flags",
                                // tp_name
    sizeof(flags_object),       // tp_basicsize
    0,                          // tp_itemsize
    flags_dealloc,              // tp_dealloc
    0,                          // tp_vectorcall_offset
    nullptr,                    // tp_getattr
    nullptr,                    // tp_setattr
    nullptr,                    // tp_as_async
    nullptr,                    // tp_repr
    nullptr,                    // tp_as_number
    nullptr,                    // tp_as_sequence
    &flags_as_mapping,          // tp_as_mapping
    nullptr,                    // tp_hash
    nullptr,                    // tp_call
    nullptr,                    // tp_str
    nullptr,                    // tp_getattro
    nullptr,                    // tp_setattro
    nullptr,                    // tp_as_buffer
    Py_TPFLAGS_DEFAULT | Py_TPFLAGS_BASETYPE,
                                // tp_flags
    "8080 condition flags",     // tp_doc
    nullptr,                    // tp_traverse
    nullptr,                    // tp_clear
    nullptr,                    // tp_richcompare
    0,                          // tp_weaklistoffset
    flags_iter,                 // tp_iter
    nullptr,                    // tp_iternext
    flags_methods,              // tp_methods
    nullptr,                    // tp_members
    nullptr,                    // tp_getset
    nullptr,                    // tp_base
    nullptr,                    // tp_dict
    nullptr,                    // tp_descr_get
    nullptr,                    // tp_descr_set
    0,                          // tp_dictoffset
    nullptr,                    // tp_init
    nullptr,                    // tp_alloc
    flags_new,                  // tp_new
};

struct registers_object {
    PyObject_HEAD
    register_file regs;
};

register_file &get_regs(PyObject *self) {
    return reinterpret_cast<registers_object*>(self)->regs;
}

PyObject *registers_new(PyTypeObject *type, PyObject *args, PyObject *kwds) {
    i8080core::unused(args, kwds);
    PyObject *self = type->tp_alloc(type, 0);
    if(!self)
        return nullptr;

    new(&get_regs(self)) register_file();
    return self;
}

void registers_dealloc(PyObject *self) {
    get_regs(self).~register_file();
    Py_TYPE(self)->tp_free(self);
}

PyObject *registers_subscript(PyObject *self, PyObject *key) {
    unsigned code;
    if(!get_key(key, state_error::invalid_register, code))
        return nullptr;
    i8080core::result<fast_u8> r = get_regs(self).get(code);
    if(!r)
        return raise_error(r.get_error());
    return PyLong_FromUnsignedLong(r.get());
}

int registers_ass_subscript(PyObject *self, PyObject *key, PyObject *value) {
    if(!value) {
        PyErr_SetString(PyExc_TypeError, "registers cannot be deleted");
        return -1;
    }

    unsigned code;
    if(!get_key(key, state_error::invalid_register, code))
        return -1;

    long n;
    if(!get_int(value, state_error::type_mismatch, n))
        return -1;

    state_error e = get_regs(self).set(code, i8080core::mask8(n));
    if(e != state_error::none) {
        raise_error(e);
        return -1;
    }
    return 0;
}

PyObject *registers_get_address_from_pair(PyObject *self, PyObject *arg) {
    long code;
    if(!get_int(arg, state_error::invalid_pair, code))
        return nullptr;
    if(code < 0 || code > 0xff)
        return raise_error(state_error::invalid_pair);

    i8080core::result<fast_u16> r =
        get_regs(self).get_address_from_pair(static_cast<unsigned>(code));
    if(!r)
        return raise_error(r.get_error());
    return PyLong_FromUnsignedLong(r.get());
}

PyObject *registers_get_value_from_pair(PyObject *self, PyObject *arg) {
    register_pair rp;
    if(!parse_pair(arg, rp))
        return nullptr;

    i8080core::result<fast_u16> r = get_regs(self).get_pair_value(rp);
    if(!r)
        return raise_error(r.get_error());
    return PyLong_FromUnsignedLong(r.get());
}

PyObject *registers_set_value_for_pair(PyObject *self, PyObject *args) {
    PyObject *pair;
    unsigned long nn;
    if(!PyArg_ParseTuple(args, "Ok", &pair, &nn))
        return nullptr;

    register_pair rp;
    if(!parse_pair(pair, rp))
        return nullptr;

    state_error e = get_regs(self).set_pair_value(
        rp, static_cast<fast_u16>(nn & 0xffff));
    if(e != state_error::none)
        return raise_error(e);
    Py_RETURN_NONE;
}

PyObject *registers_get_register_from_opcode(PyObject *self, PyObject *args) {
    i8080core::unused(self);
    unsigned op, offset;
    if(!PyArg_ParseTuple(args, "II", &op, &offset))
        return nullptr;
    reg r = register_file::get_register_from_opcode(i8080core::mask8(op),
                                                    offset);
    return PyLong_FromLong(static_cast<long>(r));
}

PyObject *registers_get_pair_from_encoding(PyObject *self, PyObject *arg) {
    i8080core::unused(self);
    long p;
    if(!get_int(arg, state_error::type_mismatch, p))
        return nullptr;
    if(p < 0 || p > 0xff)
        return raise_error(state_error::invalid_pair);

    i8080core::result<register_pair> r =
        register_file::get_pair_from_encoding(static_cast<fast_u8>(p));
    if(!r)
        return raise_error(r.get_error());
    return build_pair(r.get());
}

PyObject *registers_reset(PyObject *self, PyObject *args) {
    i8080core::unused(args);
    get_regs(self).reset();
    Py_RETURN_NONE;
}

PyMethodDef registers_methods[] = {
    {"get_address_from_pair", registers_get_address_from_pair, METH_O,
     "Return the address held by the pair named by B, D or H."},
    {"get_value_from_pair", registers_get_value_from_pair, METH_O,
     "Return the 16-bit value of a (hi, lo) register pair."},
    {"set_value_for_pair", registers_set_value_for_pair, METH_VARARGS,
     "Store a 16-bit value to a (hi, lo) register pair."},
    {"get_register_from_opcode", registers_get_register_from_opcode,
     METH_VARARGS | METH_STATIC,
     "Return the register code at the given bit offset of an opcode."},
    {"get_pair_from_encoding", registers_get_pair_from_encoding,
     METH_O | METH_STATIC,
     "Return the (hi, lo) pair for a two-bit pair selector."},
    {"reset", registers_reset, METH_NOARGS,
     "Restore the power-on state."},
    { nullptr, nullptr, 0, nullptr }  // Sentinel.
};

PyMappingMethods registers_as_mapping = {
    nullptr,                    // mp_length
    registers_subscript,        // mp_subscript
    registers_ass_subscript,    // mp_ass_subscript
};

PyTypeObject registers_type_object = {
    PyVarObject_HEAD_INIT(&PyType_Type, 0)
    "i8080core._i8080core._Registers",
                                // tp_name
    sizeof(registers_object),   // tp_basicsize
    0,                          // tp_itemsize
    registers_dealloc,          // tp_dealloc
    0,                          // tp_vectorcall_offset
    nullptr,                    // tp_getattr
    nullptr,                    // tp_setattr
    nullptr,                    // tp_as_async
    nullptr,                    // tp_repr
    nullptr,                    // tp_as_number
    nullptr,                    // tp_as_sequence
    &registers_as_mapping,      // tp_as_mapping
    nullptr,                    // tp_hash
    nullptr,                    // tp_call
    nullptr,                    // tp_str
    nullptr,                    // tp_getattro
    nullptr,                    // tp_setattro
    nullptr,                    // tp_as_buffer
    Py_TPFLAGS_DEFAULT | Py_TPFLAGS_BASETYPE,
                                // tp_flags
    "8080 general-purpose registers",
                                // tp_doc
    nullptr,                    // tp_traverse
    nullptr,                    // tp_clear
    nullptr,                    // tp_richcompare
    0,                          // tp_weaklistoffset
    nullptr,                    // tp_iter
    nullptr,                    // tp_iternext
    registers_methods,          // tp_methods
    nullptr,                    // tp_members
    nullptr,                    // tp_getset
    nullptr,                    // tp_base
    nullptr,                    // tp_dict
    nullptr,                    // tp_descr_get
    nullptr,                    // tp_descr_set
    0,                          // tp_dictoffset
    nullptr,                    // tp_init
    nullptr,                    // tp_alloc
    registers_new,              // tp_new
};

PyModuleDef module = {
    PyModuleDef_HEAD_INIT,      // m_base
    "i8080core._i8080core",     // m_name
    "Intel 8080 CPU State Module",
                                // m_doc
    -1,                         // m_size
    nullptr,                    // m_methods
    nullptr,                    // m_slots
    nullptr,                    // m_traverse
    nullptr,                    // m_clear
    nullptr,                    // m_free
};

struct int_constant {
    const char *name;
    long value;
};

const int_constant int_constants[] = {
    {"B", static_cast<long>(reg::b)},
    {"C", static_cast<long>(reg::c)},
    {"D", static_cast<long>(reg::d)},
    {"E", static_cast<long>(reg::e)},
    {"H", static_cast<long>(reg::h)},
    {"L", static_cast<long>(reg::l)},
    {"M", static_cast<long>(reg::at_hl)},
    {"A", static_cast<long>(reg::a)},
    {"CARRY", static_cast<long>(i8080core::flag::cf)},
    {"PARITY", static_cast<long>(i8080core::flag::pf)},
    {"AUX_CARRY", static_cast<long>(i8080core::flag::hf)},
    {"ZERO", static_cast<long>(i8080core::flag::zf)},
    {"SIGN", static_cast<long>(i8080core::flag::sf)},
};

bool add_object(PyObject *m, const char *name, PyObject *object) {
    Py_INCREF(object);
    if(PyModule_AddObject(m, name, object) < 0) {
        Py_DECREF(object);
        return false;
    }
    return true;
}

}  // anonymous namespace

extern "C" PyMODINIT_FUNC PyInit__i8080core(void) {
    if(PyType_Ready(&flags_type_object) < 0)
        return nullptr;
    if(PyType_Ready(&registers_type_object) < 0)
        return nullptr;

    PyObject *m = PyModule_Create(&module);
    if(!m)
        return nullptr;

    if(!invalid_flag_error) {
        invalid_flag_error = PyErr_NewException(
            "i8080core._i8080core.InvalidFlagError", nullptr, nullptr);
        if(!invalid_flag_error) {
            Py_DECREF(m);
            return nullptr;
        }
    }

    if(!invalid_pair_error) {
        invalid_pair_error = PyErr_NewException(
            "i8080core._i8080core.InvalidPairError", nullptr, nullptr);
        if(!invalid_pair_error) {
            Py_DECREF(m);
            return nullptr;
        }
    }

    if(!add_object(m, "_Flags", &flags_type_object.ob_base.ob_base) ||
       !add_object(m, "_Registers",
                   &registers_type_object.ob_base.ob_base) ||
       !add_object(m, "InvalidFlagError", invalid_flag_error) ||
       !add_object(m, "InvalidPairError", invalid_pair_error)) {
        Py_DECREF(m);
        return nullptr;
    }

    for(const int_constant &c : int_constants) {
        if(PyModule_AddIntConstant(m, c.name, c.value) < 0) {
            Py_DECREF(m);
            return nullptr;
        }
    }

    return m;
}
